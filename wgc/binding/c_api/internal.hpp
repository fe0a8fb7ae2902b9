#pragma once

// =============================================================================
// FILE: wgc/binding/c_api/internal.hpp
// BRIEF: Error plumbing shared by the C entry points (not installed)
// =============================================================================

#include "wgc/binding/c_api/core.h"
#include "wgc/core/macros.hpp"

#include <string_view>

namespace wgc::binding {

// Thread-local last-error slot behind wgc_get_last_error*()
void record_error(wgc_error_t code, std::string_view message) noexcept;
void reset_error() noexcept;
[[nodiscard]] const char* last_error_message() noexcept;
[[nodiscard]] wgc_error_t last_error_code() noexcept;

// Records the exception being handled and returns its code. Only valid
// inside a catch handler.
[[nodiscard]] wgc_error_t translate_current_exception() noexcept;

// NOLINTBEGIN(cppcoreguidelines-macro-usage)

#define WGC_C_API_CHECK_NULL(arg, what) \
    do { \
        if (WGC_UNLIKELY((arg) == nullptr)) { \
            ::wgc::binding::record_error(WGC_ERROR_NULL_POINTER, (what)); \
            return WGC_ERROR_NULL_POINTER; \
        } \
    } while (0)

// Body of every entry point: WGC_C_API_TRY ... WGC_C_API_RETURN_OK; WGC_C_API_CATCH
#define WGC_C_API_TRY try {
#define WGC_C_API_CATCH \
    } catch (...) { \
        return ::wgc::binding::translate_current_exception(); \
    }

#define WGC_C_API_RETURN_OK \
    do { \
        ::wgc::binding::reset_error(); \
        return WGC_OK; \
    } while (0)

// NOLINTEND(cppcoreguidelines-macro-usage)

} // namespace wgc::binding
