#pragma once

#include "config.h"
#include <string>
#include <atomic>
#include <nlohmann/json.hpp>

// Forward declaration
struct mosquitto;

// Publishes detection/recording/upload events and periodic status to an
// MQTT broker.
class EventPublisher {
public:
    explicit EventPublisher(const MqttSettings& settings);
    ~EventPublisher();

    EventPublisher(const EventPublisher&) = delete;
    EventPublisher& operator=(const EventPublisher&) = delete;

    // Connection management
    bool connect();
    void disconnect();
    bool isConnected() const;

    // Publishing
    bool publishEvent(const std::string& type, const nlohmann::json& data);
    bool publishStatus(const nlohmann::json& status);
    bool publish(const std::string& topic, const std::string& message, int qos = 1, bool retain = false);

    // Topics
    std::string eventTopic(const std::string& type) const;
    std::string statusTopic() const;

    static nlohmann::json buildEventPayload(const std::string& type, const nlohmann::json& data);

private:
    MqttSettings settings_;
    struct mosquitto* mqtt_handle_;
    std::atomic<bool> connected_;
    bool loop_started_;

    void initializeMqtt();
    void cleanupMqtt();
    bool setupCredentials();
};
