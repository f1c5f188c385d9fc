#include <joblog/io/config_loader.hpp>
#include <joblog/io/error.hpp>

#include <joblog/core/error.hpp>

#include <rapidjson/document.h>
#include <rapidjson/error/en.h>

#include <fstream>
#include <sstream>
#include <string>

namespace joblog::io {

namespace {

constexpr const char* kWarningKey = "warning_threshold_sec";
constexpr const char* kErrorKey = "error_threshold_sec";

double get_seconds_or(const rapidjson::Value& obj, const char* name, double default_val) {
    if (!obj.HasMember(name)) {
        return default_val;
    }
    const auto& member = obj[name];
    if (!member.IsNumber()) {
        throw LoaderError(std::string("field '") + name + "' must be a number", "thresholds");
    }
    const double value = member.GetDouble();
    if (value < 0.0) {
        throw LoaderError(std::string("field '") + name + "' must be non-negative", "thresholds");
    }
    return value;
}

core::Thresholds load_from_document(const rapidjson::Document& doc) {
    if (!doc.IsObject()) {
        throw LoaderError("configuration must be a JSON object", "thresholds");
    }

    const double warning = get_seconds_or(doc, kWarningKey, core::Thresholds::kDefaultWarningSeconds);
    const double error = get_seconds_or(doc, kErrorKey, core::Thresholds::kDefaultErrorSeconds);

    try {
        return core::Thresholds{warning, error};
    } catch (const core::InvalidThresholdsError& e) {
        throw LoaderError(e.what(), "thresholds");
    }
}

} // anonymous namespace

core::Thresholds load_thresholds(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        throw LoaderError("cannot open file", path.string());
    }

    std::ostringstream oss;
    oss << file.rdbuf();

    try {
        return load_thresholds_from_string(oss.str());
    } catch (const LoaderError& e) {
        throw LoaderError(e.what(), path.string());
    }
}

core::Thresholds load_thresholds_from_string(std::string_view json) {
    rapidjson::Document doc;
    doc.Parse(json.data(), json.size());

    if (doc.HasParseError()) {
        throw LoaderError(
            std::string("JSON parse error: ") + rapidjson::GetParseError_En(doc.GetParseError()),
            "at offset " + std::to_string(doc.GetErrorOffset()));
    }

    return load_from_document(doc);
}

core::Thresholds resolve_thresholds(const std::optional<std::filesystem::path>& config,
                                    std::optional<double> warning,
                                    std::optional<double> error) {
    core::Thresholds base;
    if (config) {
        base = load_thresholds(*config);
    }

    try {
        return core::Thresholds{warning.value_or(base.warning_seconds()),
                                error.value_or(base.error_seconds())};
    } catch (const core::InvalidThresholdsError& e) {
        throw LoaderError(e.what(), "command line");
    }
}

} // namespace joblog::io
