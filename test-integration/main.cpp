#include <rotalog/rotalog.hpp>

using namespace rotalog;

int main()
{
    // Console logger, everything down to TRACE
    auto log = make_logger("receiver = \"CONSOLE\"\nlevel = \"TRACE\"\n");

    // Test basic logging
    if (log->info("Integration test successful!")) return 1;
    if (log->debug("Debug message")) return 1;
    if (log->warnf("Warning message {}", 42)) return 1;

    // Test caller location in the pattern
    auto pattern = make_pattern("%level:-5 %shortfile %line %message");
    logger located(log_level::info, pattern, make_console_receiver(pattern, false));
    if (located.info("User login ", 12345, " from ", "192.168.1.1")) return 1;

    return log->get_stats().lines_written == 3 ? 0 : 1;
}
