#include "ipsec/Log.hpp"
#include <string>

namespace ipsec::log {

std::shared_ptr<spdlog::logger> get() {
    static const std::shared_ptr<spdlog::logger> logger = [] {
        if (auto existing = spdlog::get(std::string(Name))) {
            return existing;
        }
        auto created = std::make_shared<spdlog::logger>(std::string(Name));
        created->set_level(spdlog::level::info);
        spdlog::register_logger(created);
        return created;
    }();
    return logger;
}

void attachSink(const spdlog::sink_ptr& sink) {
    get()->sinks().push_back(sink);
}

void setLevel(const spdlog::level::level_enum level) {
    get()->set_level(level);
}

}
