#ifndef PRETENST_SERIALIZATION_JSON_SERIALIZATION_HPP
#define PRETENST_SERIALIZATION_JSON_SERIALIZATION_HPP

#include <nlohmann/json.hpp>
#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <string>

namespace pretenst::json {

constexpr const char* SERIALIZATION_VERSION = "0.1.0";

// Pipeline steps, named in each file's envelope
constexpr const char* STEP_TENSCRIPT = "tenscript";
constexpr const char* STEP_FABRIC = "fabric";

// Envelope around every file the CLI writes: the payload plus where it
// came from, the configuration it was produced with and summary counts.
struct SerializedData {
    std::string version = SERIALIZATION_VERSION;
    std::string step;
    std::string timestamp;
    std::string source_file;
    nlohmann::json config;
    nlohmann::json stats;
    nlohmann::json data;

    // Throws if this envelope holds another step's output
    void require_step(const std::string& expected) const {
        if (step != expected) {
            throw std::runtime_error("Expected '" + expected + "' data, found '" + step + "'");
        }
    }
};

// Optional members are left out when empty
inline void to_json(nlohmann::json& j, const SerializedData& envelope) {
    j = nlohmann::json{{"version", envelope.version}, {"step", envelope.step}};
    if (!envelope.timestamp.empty()) j["timestamp"] = envelope.timestamp;
    if (!envelope.source_file.empty()) j["source_file"] = envelope.source_file;
    if (!envelope.config.is_null()) j["config"] = envelope.config;
    if (!envelope.stats.is_null()) j["stats"] = envelope.stats;
    j["data"] = envelope.data;
}

inline void from_json(const nlohmann::json& j, SerializedData& envelope) {
    if (!j.is_object() || !j.contains("data")) {
        throw std::runtime_error("Serialized data has no 'data' block");
    }
    envelope.version = j.value("version", std::string("unknown"));
    envelope.step = j.value("step", std::string("unknown"));
    envelope.timestamp = j.value("timestamp", std::string());
    envelope.source_file = j.value("source_file", std::string());
    envelope.config = j.value("config", nlohmann::json());
    envelope.stats = j.value("stats", nlohmann::json());
    envelope.data = j.at("data");
}

// Current UTC time, ISO 8601
inline std::string get_timestamp() {
    std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm utc = *std::gmtime(&now);
    std::ostringstream text;
    text << std::put_time(&utc, "%Y-%m-%dT%H:%M:%SZ");
    return text.str();
}

inline void write_json_file(const std::string& path, const nlohmann::json& j) {
    std::ofstream out(path);
    if (!out) {
        throw std::runtime_error("Cannot write " + path);
    }
    out << j.dump(2) << '\n';
}

inline nlohmann::json read_json_file(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("Cannot open " + path);
    }
    try {
        return nlohmann::json::parse(in);
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error("Invalid JSON in " + path + ": " + e.what());
    }
}

inline void write_serialized(const std::string& path, const SerializedData& envelope) {
    write_json_file(path, nlohmann::json(envelope));
}

inline SerializedData read_serialized(const std::string& path, const std::string& expected_step) {
    SerializedData envelope = read_json_file(path).get<SerializedData>();
    envelope.require_step(expected_step);
    return envelope;
}

}  // namespace pretenst::json

#endif // PRETENST_SERIALIZATION_JSON_SERIALIZATION_HPP
