// =============================================================================
// docrecon - Config Loader Implementation
// =============================================================================

#include "docrecon/io/config_loader.h"

#include <array>
#include <chrono>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <fstream>
#include <iterator>
#include <memory>
#include <string>
#include <utility>

#include <fmt/format.h>
#include <json/json.h>

#include "docrecon/common/logger.h"

namespace docrecon::io {

namespace {

constexpr std::array<std::string_view, 18> kKnownKeys = {
    "allowed_anchor_classes",  "allowed_child_classes",   "document_type",
    "column_gap_margin_px",    "proximity_x_weight",      "proximity_max_distance_px",
    "lookahead_max_groups",    "large_element_area_px2",  "iou_conflict_threshold",
    "severe_overlap_area_px2", "sequence_large_jump",     "job_lock_timeout_seconds",
    "forced_strategy",         "repair_window",           "confusable_digits",
    "reassignment_iou_margin", "row_major_columns",       "lookahead_closeness_ratio"};

[[nodiscard]] bool isKnownKey(std::string_view key) noexcept {
    for (std::string_view known : kKnownKeys) {
        if (known == key) return true;
    }
    return false;
}

class ConfigReader {
public:
    ConfigReader(const Json::Value& root, std::string_view source)
        : root_(root), source_(source) {}

    [[nodiscard]] bool has(const char* key) const {
        return root_.isMember(key) && !root_[key].isNull();
    }

    void readDouble(const char* key, double& target) const {
        if (!has(key)) return;
        if (!root_[key].isNumeric()) {
            fail(fmt::format("'{}' must be a number", key));
        }
        target = root_[key].asDouble();
    }

    void readBool(const char* key, bool& target) const {
        if (!has(key)) return;
        if (!root_[key].isBool()) {
            fail(fmt::format("'{}' must be true or false", key));
        }
        target = root_[key].asBool();
    }

    [[nodiscard]] std::int64_t readInteger(const char* key) const {
        if (!root_[key].isIntegral()) {
            fail(fmt::format("'{}' must be an integer", key));
        }
        return root_[key].asInt64();
    }

    [[nodiscard]] std::string readString(const char* key) const {
        if (!root_[key].isString()) {
            fail(fmt::format("'{}' must be a string", key));
        }
        return root_[key].asString();
    }

    void readClassSet(const char* key, ElementClassSet& target) const {
        if (!has(key)) return;
        const Json::Value& list = root_[key];
        if (!list.isArray()) {
            fail(fmt::format("'{}' must be an array of class names", key));
        }
        ElementClassSet classes;
        for (const auto& item : list) {
            if (!item.isString()) {
                fail(fmt::format("'{}' must be an array of class names", key));
            }
            const auto cls = parseElementClass(item.asString());
            if (!cls) {
                fail(fmt::format("'{}': unknown class '{}'", key, item.asString()));
            }
            classes.insert(*cls);
        }
        target = classes;
    }

    void readConfusableDigits(const char* key, DigitConfusionTable& target) const {
        if (!has(key)) return;
        const Json::Value& list = root_[key];
        if (!list.isArray()) {
            fail(fmt::format("'{}' must be an array of digit pairs", key));
        }
        DigitConfusionTable table;
        for (const auto& pair : list) {
            if (!pair.isArray() || pair.size() != 2 || !pair[0].isIntegral() ||
                !pair[1].isIntegral()) {
                fail(fmt::format("'{}' must be an array of digit pairs", key));
            }
            const auto a = pair[0].asInt64();
            const auto b = pair[1].asInt64();
            if (a < 0 || a > 9 || b < 0 || b > 9 || a == b) {
                fail(fmt::format("'{}': invalid digit pair [{}, {}]", key, a, b));
            }
            table.addPair(static_cast<int>(a), static_cast<int>(b));
        }
        target = table;
    }

    [[noreturn]] void fail(std::string message) const {
        throw ConfigError(std::move(message), ErrorContext{std::string(source_)});
    }

private:
    const Json::Value& root_;
    std::string_view source_;
};

[[nodiscard]] EngineConfig applyConfig(std::string_view json, std::string_view source,
                                       const EngineConfig& base) {
    Json::CharReaderBuilder builder;
    builder["collectComments"] = false;
    const std::unique_ptr<Json::CharReader> reader(builder.newCharReader());

    Json::Value root;
    std::string errors;
    if (!reader->parse(json.data(), json.data() + json.size(), &root, &errors)) {
        throw ConfigError(fmt::format("invalid JSON: {}", errors),
                          ErrorContext{std::string(source)});
    }
    if (!root.isObject()) {
        throw ConfigError("config document must be a JSON object",
                          ErrorContext{std::string(source)});
    }

    for (const auto& key : root.getMemberNames()) {
        if (!isKnownKey(key)) {
            DOCRECON_LOG_WARNING("Ignoring unknown config key '{}' in {}", key,
                                 std::string(source));
        }
    }

    const ConfigReader in(root, source);
    EngineConfig config = base;

    in.readClassSet("allowed_anchor_classes", config.allowedAnchorClasses);
    in.readClassSet("allowed_child_classes", config.allowedChildClasses);

    if (in.has("document_type")) {
        const auto name = in.readString("document_type");
        const auto mode = parseDocumentMode(name);
        if (!mode) {
            in.fail(fmt::format("unknown document_type '{}'", name));
        }
        config.documentMode = *mode;
    }

    in.readDouble("column_gap_margin_px", config.columnGapMarginPx);
    in.readDouble("proximity_x_weight", config.proximityXWeight);
    in.readDouble("proximity_max_distance_px", config.proximityMaxDistancePx);
    in.readDouble("lookahead_closeness_ratio", config.lookaheadClosenessRatio);
    in.readDouble("large_element_area_px2", config.largeElementAreaPx2);
    in.readDouble("iou_conflict_threshold", config.iouConflictThreshold);
    in.readDouble("severe_overlap_area_px2", config.severeOverlapAreaPx2);
    in.readDouble("reassignment_iou_margin", config.reassignmentIouMargin);
    in.readBool("row_major_columns", config.rowMajorColumns);

    if (in.has("lookahead_max_groups")) {
        const auto value = in.readInteger("lookahead_max_groups");
        if (value < 0) {
            in.fail(fmt::format("lookahead_max_groups must be >= 0 (got {})", value));
        }
        config.lookaheadMaxGroups = static_cast<std::size_t>(value);
    }
    if (in.has("sequence_large_jump")) {
        config.sequenceLargeJump = in.readInteger("sequence_large_jump");
    }
    if (in.has("repair_window")) {
        config.repairWindow = in.readInteger("repair_window");
    }

    if (in.has("job_lock_timeout_seconds")) {
        double seconds = 0.0;
        in.readDouble("job_lock_timeout_seconds", seconds);
        if (!std::isfinite(seconds)) {
            in.fail("job_lock_timeout_seconds must be finite");
        }
        config.jobLockTimeout =
            std::chrono::milliseconds(static_cast<std::int64_t>(std::llround(seconds * 1000.0)));
    }

    if (in.has("forced_strategy")) {
        const auto name = in.readString("forced_strategy");
        const auto kind = parseStrategyKind(name);
        if (!kind) {
            in.fail(fmt::format("unknown forced_strategy '{}'", name));
        }
        config.forcedStrategy = *kind;
    }

    in.readConfusableDigits("confusable_digits", config.confusableDigits);

    unwrapOrThrow(config.validate());
    return config;
}

}  // namespace

Result<EngineConfig> parseConfig(std::string_view json, const EngineConfig& base) {
    return tryExecute([&] { return applyConfig(json, "<memory>", base); });
}

Result<EngineConfig> loadConfig(const std::filesystem::path& path, const EngineConfig& base) {
    std::ifstream stream(path, std::ios::binary);
    if (!stream) {
        return makeError<EngineConfig>(ErrorCode::kIOError,
                                       fmt::format("cannot open config file '{}'", path.string()));
    }
    const std::string content{std::istreambuf_iterator<char>(stream),
                              std::istreambuf_iterator<char>()};
    if (stream.bad()) {
        return makeError<EngineConfig>(ErrorCode::kIOError,
                                       fmt::format("failed to read config file '{}'", path.string()));
    }

    auto result = tryExecute([&] { return applyConfig(content, path.string(), base); });
    if (result) {
        DOCRECON_LOG_DEBUG("Loaded config from {}: {}", path.string(), describeConfig(*result));
    }
    return result;
}

}  // namespace docrecon::io
