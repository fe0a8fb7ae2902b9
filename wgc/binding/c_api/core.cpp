// =============================================================================
// FILE: wgc/binding/c_api/core.cpp
// BRIEF: Last-error storage and exception translation for the C ABI
// =============================================================================

#include "wgc/binding/c_api/core.h"
#include "wgc/binding/c_api/internal.hpp"
#include "wgc/core/error.hpp"
#include "wgc/version.hpp"

#include <algorithm>
#include <cstring>
#include <exception>
#include <new>

namespace wgc::binding {

namespace {

// Long enough for a path plus a line-numbered parse message
constexpr std::size_t MESSAGE_CAPACITY = 512;

struct LastError {
    wgc_error_t code = WGC_OK;
    char message[MESSAGE_CAPACITY] = {};
};

// NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
thread_local LastError t_last_error;

} // namespace

void record_error(wgc_error_t code, std::string_view message) noexcept {
    const std::size_t n = std::min(message.size(), MESSAGE_CAPACITY - 1);
    t_last_error.code = code;
    std::memcpy(t_last_error.message, message.data(), n);
    t_last_error.message[n] = '\0';
}

void reset_error() noexcept {
    t_last_error.code = WGC_OK;
    t_last_error.message[0] = '\0';
}

const char* last_error_message() noexcept {
    return t_last_error.message[0] != '\0' ? t_last_error.message : "No error";
}

wgc_error_t last_error_code() noexcept {
    return t_last_error.code;
}

wgc_error_t translate_current_exception() noexcept {
    wgc_error_t code = WGC_ERROR_UNKNOWN;
    try {
        throw;
    } catch (const Exception& e) {
        // ErrorCode values are the C codes
        code = static_cast<wgc_error_t>(e.code());
        record_error(code, e.what());
    } catch (const std::bad_alloc&) {
        code = WGC_ERROR_OUT_OF_MEMORY;
        record_error(code, "out of memory");
    } catch (const std::exception& e) {
        record_error(code, e.what());
    } catch (...) {
        record_error(code, "exception of unknown type");
    }
    return code;
}

} // namespace wgc::binding

extern "C" {

WGC_C_EXPORT const char* wgc_get_version(void) {
    return wgc::version_string();
}

WGC_C_EXPORT const char* wgc_get_last_error(void) {
    return wgc::binding::last_error_message();
}

WGC_C_EXPORT wgc_error_t wgc_get_last_error_code(void) {
    return wgc::binding::last_error_code();
}

WGC_C_EXPORT void wgc_clear_error(void) {
    wgc::binding::reset_error();
}

} // extern "C"
