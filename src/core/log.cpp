#include <sixpn/core/log.h>

#include <mutex>

namespace sixpn::log {
namespace {

constexpr const char* kPattern = "[{date} {time}.{ms}][{lvl}][tid={tid}] {msg}";

std::once_flag g_once;
std::unique_ptr<chlog::logger> g_logger;

chlog::logger_config MakeConfig(std::string name) {
    chlog::logger_config cfg;
    cfg.name = std::move(name);
    cfg.level = chlog::level::info;
    cfg.pattern = kPattern;
    cfg.async.enabled = false;
    cfg.parallel_sinks = false;
    return cfg;
}

} // namespace

chlog::level ParseLevel(std::string_view level) {
    if (level == "trace") return chlog::level::trace;
    if (level == "debug") return chlog::level::debug;
    if (level == "info") return chlog::level::info;
    if (level == "warn" || level == "warning") return chlog::level::warn;
    if (level == "error") return chlog::level::error;
    if (level == "critical") return chlog::level::critical;
    if (level == "off") return chlog::level::off;
    return chlog::level::info;
}

void Init(std::string_view level) {
    std::call_once(g_once, [] {
        g_logger = std::make_unique<chlog::logger>(MakeConfig("sixpn"));
        g_logger->add_sink(std::make_shared<chlog::console_sink>(chlog::console_sink::style::color));
    });

    Get().set_level(ParseLevel(level));
}

chlog::logger& Get() {
    if (!g_logger) {
        Init("info");
    }
    return *g_logger;
}

std::unique_ptr<chlog::logger> Create(std::string name, std::string_view level) {
    auto logger = std::make_unique<chlog::logger>(MakeConfig(std::move(name)));
    logger->add_sink(std::make_shared<chlog::console_sink>(chlog::console_sink::style::color));
    logger->set_level(ParseLevel(level));
    return logger;
}

} // namespace sixpn::log
