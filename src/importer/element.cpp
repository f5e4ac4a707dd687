#include "importer/element.hpp"
#include "core/utils.hpp"

#include <format>
#include <limits>
#include <unordered_map>

namespace sysmlsql {

namespace {

bool is_reference_object(const nlohmann::json& value, const std::string& id_field) {
    if (!value.is_object() || value.size() != 1) return false;
    const auto it = value.find(id_field);
    return it != value.end() && it->is_string();
}

} // anonymous namespace

FieldValue to_field_value(const nlohmann::json& value, const std::string& id_field) {
    switch (value.type()) {
        case nlohmann::json::value_t::null:
        case nlohmann::json::value_t::discarded:
            return std::monostate{};
        case nlohmann::json::value_t::boolean:
            return value.get<bool>();
        case nlohmann::json::value_t::number_integer:
            return value.get<int64_t>();
        case nlohmann::json::value_t::number_unsigned: {
            const auto u = value.get<uint64_t>();
            if (u <= static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
                return static_cast<int64_t>(u);
            }
            return static_cast<double>(u);
        }
        case nlohmann::json::value_t::number_float:
            return value.get<double>();
        case nlohmann::json::value_t::string:
            return value.get<std::string>();
        case nlohmann::json::value_t::object:
            if (is_reference_object(value, id_field)) {
                return Reference{value.at(id_field).get<std::string>()};
            }
            return StructuredValue{value};
        case nlohmann::json::value_t::array: {
            if (value.empty()) return StructuredValue{value};
            ReferenceList refs;
            refs.reserve(value.size());
            for (const auto& entry : value) {
                if (!is_reference_object(entry, id_field)) return StructuredValue{value};
                refs.push_back(Reference{entry.at(id_field).get<std::string>()});
            }
            return refs;
        }
        case nlohmann::json::value_t::binary:
            return StructuredValue{value};
    }
    return std::monostate{};
}

Result<std::vector<Element>, ImportError> parse_elements(const nlohmann::json& document,
                                                         const std::string& id_field,
                                                         const std::string& type_field) {
    using R = Result<std::vector<Element>, ImportError>;

    auto malformed = [](size_t index, std::string detail) {
        return R::error(ImportError{.kind = ImportErrorKind::MALFORMED_ELEMENT,
                                    .element_index = index, .detail = std::move(detail)});
    };

    if (!document.is_array()) {
        return malformed(0, std::format("expected a JSON array of elements, got {}",
                                        document.type_name()));
    }

    std::vector<Element> elements;
    elements.reserve(document.size());
    std::unordered_map<std::string, size_t> by_id;
    size_t collapsed = 0;

    for (size_t i = 0; i < document.size(); ++i) {
        const auto& entry = document[i];
        if (!entry.is_object()) {
            return malformed(i, std::format("expected an object, got {}", entry.type_name()));
        }
        const auto id = entry.find(id_field);
        if (id == entry.end() || !id->is_string() || id->get_ref<const std::string&>().empty()) {
            return malformed(i, std::format("missing or non-string \"{}\"", id_field));
        }
        const auto type = entry.find(type_field);
        if (type == entry.end() || !type->is_string() || type->get_ref<const std::string&>().empty()) {
            return malformed(i, std::format("element {} has a missing or non-string \"{}\"",
                                            id->get<std::string>(), type_field));
        }

        Element element;
        element.id = id->get<std::string>();
        element.type = type->get<std::string>();
        for (const auto& [name, value] : entry.items()) {
            if (name == id_field || name == type_field) continue;
            element.properties.emplace(name, to_field_value(value, id_field));
        }

        const auto [it, inserted] = by_id.try_emplace(element.id, elements.size());
        if (!inserted) {
            if (elements[it->second] == element) {
                ++collapsed;
                continue;
            }
            return R::error(ImportError{.kind = ImportErrorKind::CONFLICTING_DUPLICATE,
                                        .element_id = element.id, .element_index = i});
        }
        elements.push_back(std::move(element));
    }

    if (collapsed > 0) {
        utils::log::warn(std::format("collapsed {} duplicate element entries", collapsed));
    }
    utils::log::debug(std::format("parsed {} elements", elements.size()));
    return R::ok(std::move(elements));
}

} // namespace sysmlsql
