#include "event_publisher.h"
#include "logger.h"
#include <ctime>
#include <mosquitto.h>

EventPublisher::EventPublisher(const MqttSettings& settings)
    : settings_(settings)
    , mqtt_handle_(nullptr)
    , connected_(false)
    , loop_started_(false) {

    initializeMqtt();
}

EventPublisher::~EventPublisher() {
    disconnect();
    cleanupMqtt();
}

bool EventPublisher::connect() {
    if (!mqtt_handle_) {
        logError("EventPublisher", "MQTT handle not initialized");
        return false;
    }

    if (!setupCredentials()) {
        return false;
    }

    // the network thread owns the connection, including the first attempt
    mosquitto_reconnect_delay_set(mqtt_handle_, 2, 60, true);

    int result = mosquitto_loop_start(mqtt_handle_);
    if (result != MOSQ_ERR_SUCCESS) {
        logError("EventPublisher", std::string("Failed to start MQTT loop: ") + mosquitto_strerror(result));
        return false;
    }
    loop_started_ = true;

    result = mosquitto_connect_async(mqtt_handle_, settings_.host.c_str(), settings_.port, 60);
    if (result != MOSQ_ERR_SUCCESS) {
        logWarning("EventPublisher", "MQTT broker " + settings_.host + ":" + std::to_string(settings_.port) +
                   " not reachable yet (" + mosquitto_strerror(result) + "), retrying in the background");
    } else {
        logInfo("EventPublisher", "Connecting to MQTT broker " + settings_.host + ":" + std::to_string(settings_.port));
    }
    return true;
}

void EventPublisher::disconnect() {
    if (!mqtt_handle_ || !loop_started_) {
        return;
    }

    mosquitto_disconnect(mqtt_handle_);
    mosquitto_loop_stop(mqtt_handle_, true);
    loop_started_ = false;
    connected_ = false;
    logInfo("EventPublisher", "Disconnected from MQTT broker");
}

bool EventPublisher::isConnected() const {
    return connected_ && mqtt_handle_;
}

nlohmann::json EventPublisher::buildEventPayload(const std::string& type, const nlohmann::json& data) {
    nlohmann::json payload = data.is_object() ? data : nlohmann::json::object();
    if (!data.is_object() && !data.is_null()) {
        payload["data"] = data;
    }
    payload["type"] = type;
    payload["timestamp"] = static_cast<long long>(std::time(nullptr));
    return payload;
}

bool EventPublisher::publishEvent(const std::string& type, const nlohmann::json& data) {
    return publish(eventTopic(type), buildEventPayload(type, data).dump(), 1, false);
}

bool EventPublisher::publishStatus(const nlohmann::json& status) {
    return publish(statusTopic(), status.dump(), 1, true);
}

bool EventPublisher::publish(const std::string& topic, const std::string& message, int qos, bool retain) {
    if (!isConnected()) {
        logError("EventPublisher", "Not connected to broker, dropping message for " + topic);
        return false;
    }

    int result = mosquitto_publish(mqtt_handle_, nullptr, topic.c_str(),
                                   static_cast<int>(message.length()), message.c_str(), qos, retain);
    if (result != MOSQ_ERR_SUCCESS) {
        logError("EventPublisher", "Failed to publish to topic " + topic + ": " + mosquitto_strerror(result));
        return false;
    }

    logDebug("EventPublisher", "Published message to topic: " + topic);
    return true;
}

std::string EventPublisher::eventTopic(const std::string& type) const {
    return settings_.topic_prefix + "/events/" + type;
}

std::string EventPublisher::statusTopic() const {
    return settings_.topic_prefix + "/status";
}

void EventPublisher::initializeMqtt() {
    mosquitto_lib_init();

    mqtt_handle_ = mosquitto_new(settings_.client_id.c_str(), true, this);
    if (!mqtt_handle_) {
        logError("EventPublisher", "Failed to create MQTT client instance");
        return;
    }

    mosquitto_connect_callback_set(mqtt_handle_, [](struct mosquitto*, void* userdata, int result) {
        EventPublisher* publisher = static_cast<EventPublisher*>(userdata);
        if (result == 0) {
            publisher->connected_ = true;
            logInfo("EventPublisher", "Connected to broker");
        } else {
            logError("EventPublisher", std::string("Connection refused: ") + mosquitto_connack_string(result));
        }
    });

    mosquitto_disconnect_callback_set(mqtt_handle_, [](struct mosquitto*, void* userdata, int result) {
        EventPublisher* publisher = static_cast<EventPublisher*>(userdata);
        publisher->connected_ = false;
        if (result != 0) {
            logWarning("EventPublisher", "Unexpected disconnect from broker, reconnecting");
        }
    });
}

void EventPublisher::cleanupMqtt() {
    if (mqtt_handle_) {
        mosquitto_destroy(mqtt_handle_);
        mqtt_handle_ = nullptr;
    }
    mosquitto_lib_cleanup();
}

bool EventPublisher::setupCredentials() {
    if (!settings_.username.empty()) {
        int result = mosquitto_username_pw_set(mqtt_handle_, settings_.username.c_str(),
                                               settings_.password.empty() ? nullptr : settings_.password.c_str());
        if (result != MOSQ_ERR_SUCCESS) {
            logError("EventPublisher", std::string("Failed to set credentials: ") + mosquitto_strerror(result));
            return false;
        }
    }

    if (settings_.use_tls) {
        const char* ca_file = settings_.ca_cert_path.empty() ? nullptr : settings_.ca_cert_path.c_str();
        const char* ca_path = ca_file ? nullptr : "/etc/ssl/certs";
        int result = mosquitto_tls_set(mqtt_handle_, ca_file, ca_path, nullptr, nullptr, nullptr);
        if (result != MOSQ_ERR_SUCCESS) {
            logError("EventPublisher", std::string("Failed to set TLS certificates: ") + mosquitto_strerror(result));
            return false;
        }

        result = mosquitto_tls_opts_set(mqtt_handle_, 1, "tlsv1.2", nullptr);
        if (result != MOSQ_ERR_SUCCESS) {
            logError("EventPublisher", std::string("Failed to set TLS options: ") + mosquitto_strerror(result));
            return false;
        }
        logInfo("EventPublisher", "TLS configured");
    }

    return true;
}
