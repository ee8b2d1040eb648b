// =============================================================================
// docrecon - Page Reader Implementation
// =============================================================================

#include "docrecon/io/page_reader.h"

#include <cmath>
#include <fstream>
#include <iterator>
#include <memory>
#include <string>
#include <unordered_set>
#include <utility>

#include <fmt/format.h>
#include <json/json.h>

#include "docrecon/common/logger.h"

namespace docrecon::io {

namespace {

struct ParseScope {
    std::string_view source;
    std::uint32_t page = 0;
};

[[noreturn]] void fail(const ParseScope& scope, std::string message) {
    throw MalformedInputError(std::move(message),
                              ErrorContext{std::string(scope.source)}.withPage(scope.page));
}

[[nodiscard]] double requireNumber(const Json::Value& value, std::string_view field,
                                   const ParseScope& scope) {
    if (!value.isNumeric()) {
        fail(scope, fmt::format("'{}' must be a number", field));
    }
    return value.asDouble();
}

[[nodiscard]] std::optional<double> optionalNumber(const Json::Value& object,
                                                   const char* field, const ParseScope& scope) {
    if (!object.isMember(field) || object[field].isNull()) {
        return std::nullopt;
    }
    return requireNumber(object[field], field, scope);
}

[[nodiscard]] std::optional<std::string> optionalString(const Json::Value& object,
                                                        const char* field,
                                                        const ParseScope& scope) {
    if (!object.isMember(field) || object[field].isNull()) {
        return std::nullopt;
    }
    if (!object[field].isString()) {
        fail(scope, fmt::format("'{}' must be a string", field));
    }
    return object[field].asString();
}

[[nodiscard]] geometry::BoundingBox parseBox(const Json::Value& element, const ParseScope& scope,
                                             std::size_t position) {
    if (!element.isMember("bbox")) {
        fail(scope, fmt::format("element #{} has no 'bbox'", position));
    }
    const Json::Value& bbox = element["bbox"];
    if (!bbox.isArray() || bbox.size() != 4) {
        fail(scope, fmt::format("element #{}: 'bbox' must be [x1, y1, x2, y2]", position));
    }
    geometry::BoundingBox box{requireNumber(bbox[0], "bbox[0]", scope),
                              requireNumber(bbox[1], "bbox[1]", scope),
                              requireNumber(bbox[2], "bbox[2]", scope),
                              requireNumber(bbox[3], "bbox[3]", scope)};
    // Zero or inverted extents are left for preprocessing to drop.
    for (const double coordinate : {box.x1, box.y1, box.x2, box.y2}) {
        if (!std::isfinite(coordinate) || coordinate < 0.0) {
            fail(scope, fmt::format("element #{}: invalid bbox {}", position, box.toString()));
        }
    }
    return box;
}

[[nodiscard]] Element parseElement(const Json::Value& value, const ParseScope& scope,
                                   std::size_t position) {
    if (!value.isObject()) {
        fail(scope, fmt::format("element #{} is not an object", position));
    }

    Element element;
    if (value.isMember("id")) {
        const Json::Value& id = value["id"];
        if (!id.isIntegral() || (id.isInt64() && id.asInt64() < 0)) {
            fail(scope, fmt::format("element #{}: 'id' must be a non-negative integer", position));
        }
        element.id = id.asUInt64();
    } else {
        element.id = static_cast<ElementId>(position);
    }

    const auto label = optionalString(value, "class", scope);
    if (!label) {
        fail(scope, fmt::format("element #{} has no 'class'", position));
    }
    element.label = *label;
    element.cls = elementClassFromLabel(element.label);
    if (element.cls == ElementClass::kUnknown) {
        DOCRECON_LOG_DEBUG("Element {}: unrecognized class '{}'", element.id, element.label);
    }

    element.box = parseBox(value, scope, position);

    element.confidence = optionalNumber(value, "confidence", scope).value_or(1.0);
    if (element.confidence < 0.0 || element.confidence > 1.0) {
        fail(scope, fmt::format("element #{}: confidence {} outside [0, 1]", position,
                                element.confidence));
    }

    element.text = optionalString(value, "text", scope);
    element.textConfidence = optionalNumber(value, "text_confidence", scope);
    element.description = optionalString(value, "description", scope);
    return element;
}

[[nodiscard]] PageInput parsePage(const Json::Value& value, std::string_view source,
                                  std::string_view defaultJobId, std::uint32_t position) {
    ParseScope scope{source, position};
    if (!value.isObject()) {
        fail(scope, "page is not an object");
    }

    PageInput page;
    page.jobId = optionalString(value, "job_id", scope).value_or(std::string(defaultJobId));

    if (value.isMember("page")) {
        if (!value["page"].isUInt()) {
            fail(scope, "'page' must be a non-negative integer");
        }
        page.page = value["page"].asUInt();
        scope.page = page.page;
    } else {
        page.page = position;
    }

    page.pageWidth = optionalNumber(value, "page_width", scope);
    page.pageHeight = optionalNumber(value, "page_height", scope);
    if ((page.pageWidth && *page.pageWidth <= 0.0) || (page.pageHeight && *page.pageHeight <= 0.0)) {
        fail(scope, "page dimensions must be positive");
    }

    if (const auto mode = optionalString(value, "document_type", scope)) {
        page.documentMode = parseDocumentMode(*mode);
        if (!page.documentMode) {
            fail(scope, fmt::format("unknown document_type '{}'", *mode));
        }
    }

    if (!value.isMember("elements")) {
        fail(scope, "page has no 'elements'");
    }
    const Json::Value& elements = value["elements"];
    if (!elements.isArray()) {
        fail(scope, "'elements' must be an array");
    }

    std::unordered_set<ElementId> seen;
    page.elements.reserve(elements.size());
    for (Json::ArrayIndex i = 0; i < elements.size(); ++i) {
        Element element = parseElement(elements[i], scope, i);
        if (!seen.insert(element.id).second) {
            fail(scope, fmt::format("duplicate element id {}", element.id));
        }
        page.elements.push_back(std::move(element));
    }
    return page;
}

[[nodiscard]] std::vector<PageInput> parseDocument(std::string_view json, std::string_view source,
                                                   std::string_view defaultJobId) {
    Json::CharReaderBuilder builder;
    builder["collectComments"] = false;
    const std::unique_ptr<Json::CharReader> reader(builder.newCharReader());

    Json::Value root;
    std::string errors;
    if (!reader->parse(json.data(), json.data() + json.size(), &root, &errors)) {
        throw MalformedInputError(fmt::format("invalid JSON: {}", errors),
                                  ErrorContext{std::string(source)});
    }

    std::vector<PageInput> pages;
    if (root.isObject() && root.isMember("pages")) {
        const Json::Value& list = root["pages"];
        if (!list.isArray()) {
            throw MalformedInputError("'pages' must be an array", ErrorContext{std::string(source)});
        }
        pages.reserve(list.size());
        for (Json::ArrayIndex i = 0; i < list.size(); ++i) {
            pages.push_back(parsePage(list[i], source, defaultJobId, i));
        }
    } else {
        pages.push_back(parsePage(root, source, defaultJobId, 0));
    }

    std::size_t elementCount = 0;
    for (const auto& page : pages) {
        elementCount += page.elements.size();
    }
    DOCRECON_LOG_DEBUG("Parsed {} page(s), {} element(s) from {}", pages.size(), elementCount,
                       std::string(source));
    return pages;
}

}  // namespace

Result<std::vector<PageInput>> parsePages(std::string_view json, std::string_view sourceName) {
    return tryExecute([&] { return parseDocument(json, sourceName, kDefaultJobId); });
}

Result<std::vector<PageInput>> readPages(const std::filesystem::path& path) {
    std::ifstream stream(path, std::ios::binary);
    if (!stream) {
        return makeError<std::vector<PageInput>>(
            ErrorCode::kIOError, fmt::format("cannot open input file '{}'", path.string()));
    }
    const std::string content{std::istreambuf_iterator<char>(stream),
                              std::istreambuf_iterator<char>()};
    if (stream.bad()) {
        return makeError<std::vector<PageInput>>(
            ErrorCode::kIOError, fmt::format("failed to read input file '{}'", path.string()));
    }

    const std::string source = path.string();
    const std::string stem = path.stem().string();
    return tryExecute([&] {
        return parseDocument(content, source,
                             stem.empty() ? kDefaultJobId : std::string_view{stem});
    });
}

}  // namespace docrecon::io
