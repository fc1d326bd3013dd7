#pragma once
#include "collaborators.hpp"
#include <string>
#include <memory>
#include <nlohmann/json.hpp>
#include <sw/redis++/redis++.h>

class RedisBus : public AlertSink {
public:
    RedisBus(const std::string& redis_url, const std::string& alerts_stream);

    void publish(const nlohmann::json& alert) override;
    void publish_to_stream(const std::string& stream, const nlohmann::json& data);
    bool ping() override;

private:
    std::shared_ptr<sw::redis::Redis> redis_;
    std::string alerts_stream_;
};
