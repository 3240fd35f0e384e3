#pragma once

#include "config/Config.hpp"
#include "types/Schedule.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <nlohmann/json_fwd.hpp>

namespace bh::types {

// Fully-resolved description of one backup job. Read-only to the engine.
struct JobSpec {
    // INCREMENTAL copies only files whose destination is missing or older than the source
    enum class Type : uint8_t {
        FULL,
        INCREMENTAL
    };

    std::string id;
    std::string name;
    Type type{Type::FULL};

    std::vector<std::filesystem::path> sources; // files and/or directories
    std::filesystem::path destination;          // directory

    uint64_t chunk_size{config::DEFAULT_CHUNK_SIZE};
    uint64_t min_free_space{config::DEFAULT_MIN_FREE_SPACE};
    unsigned int max_retry_attempts{config::DEFAULT_RETRY_ATTEMPTS};
    std::chrono::milliseconds retry_delay{config::DEFAULT_RETRY_DELAY};
    std::chrono::milliseconds execution_timeout{config::DEFAULT_EXECUTION_TIMEOUT};
    bool checksum_chunks{false};

    std::optional<Schedule> schedule;

    JobSpec() = default;
    explicit JobSpec(const config::EngineConfig& defaults);

    // Throws std::invalid_argument describing the first problem found
    void validate() const;

    static std::string_view toString(Type t) noexcept;
    static bool tryParseType(std::string_view in, Type& out) noexcept;
};

// Job documents are YAML mappings. Keys not listed in the job schema are rejected.
JobSpec parseJobSpec(const std::string& yaml, const config::EngineConfig& defaults);
JobSpec loadJobSpec(const std::filesystem::path& path, const config::EngineConfig& defaults);

void to_json(nlohmann::json& j, const JobSpec& spec);

}
