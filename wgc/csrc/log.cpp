#include "wgc/core/log.hpp"

#include <mutex>

namespace wgc::log {

void init(const char* program_name, bool to_stderr) {
    static std::once_flag once;
    std::call_once(once, [program_name, to_stderr]() {
        FLAGS_logtostderr = to_stderr;
        FLAGS_colorlogtostderr = to_stderr;
        google::InitGoogleLogging(program_name ? program_name : "wgc");
    });
}

} // namespace wgc::log
