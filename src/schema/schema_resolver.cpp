#include "schema/schema_resolver.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <cstdint>
#include <format>
#include <optional>
#include <unordered_set>

namespace sysmlsql {

namespace {

enum class VisitState : uint8_t { UNVISITED, IN_PROGRESS, DONE };

SchemaError malformed(std::string detail) {
    SchemaError e;
    e.kind = SchemaErrorKind::MALFORMED_DOCUMENT;
    e.detail = std::move(detail);
    return e;
}

SchemaError unsupported(const std::string& type_name, const std::string& field,
                        std::string detail) {
    SchemaError e;
    e.kind = SchemaErrorKind::UNSUPPORTED_COMBINATOR;
    e.type_name = type_name;
    e.field = field;
    e.detail = std::move(detail);
    return e;
}

SchemaError unresolved(const std::string& type_name, std::string reference) {
    SchemaError e;
    e.kind = SchemaErrorKind::UNRESOLVED_REFERENCE;
    e.type_name = type_name;
    e.detail = std::move(reference);
    return e;
}

SchemaError cyclic(const std::vector<std::string>& chain) {
    SchemaError e;
    e.kind = SchemaErrorKind::CYCLIC_INHERITANCE;
    e.type_name = chain.empty() ? std::string{} : chain.front();
    e.detail = utils::join(chain, " -> ");
    return e;
}

const SchemaDocument* member(const SchemaDocument& node, const char* key) {
    if (!node.is_object()) return nullptr;
    const auto it = node.find(key);
    return it == node.end() ? nullptr : &*it;
}

std::optional<FieldKind> scalar_kind_of(const std::string& type) {
    if (type == "string") return FieldKind::STRING;
    if (type == "integer") return FieldKind::INTEGER;
    if (type == "number") return FieldKind::NUMBER;
    if (type == "boolean") return FieldKind::BOOLEAN;
    return std::nullopt;
}

bool is_null_schema(const SchemaDocument& node) {
    const auto* type = member(node, "type");
    return type && type->is_string() && type->get<std::string>() == "null";
}

void read_string_constraints(const SchemaDocument& node, FieldDescriptor& fd) {
    if (const auto* c = member(node, "const"); c && c->is_string()) {
        fd.constant = c->get<std::string>();
    }
    if (const auto* e = member(node, "enum"); e && e->is_array()) {
        for (const auto& v : *e) {
            if (v.is_string()) fd.enum_values.push_back(v.get<std::string>());
        }
    }
    if (const auto* f = member(node, "format"); f && f->is_string()) {
        fd.format = f->get<std::string>();
    }
}

void append_unique(std::vector<std::string>& out, const std::string& name) {
    if (std::find(out.begin(), out.end(), name) == out.end()) {
        out.push_back(name);
    }
}

} // anonymous namespace

SchemaResolver::SchemaResolver(SchemaConventions conventions)
    : conventions_(std::move(conventions)) {}

std::string SchemaResolver::ref_target(std::string_view ref) {
    const auto slash = ref.rfind('/');
    if (slash == std::string_view::npos) return std::string(ref);
    return std::string(ref.substr(slash + 1));
}

// ============================================================================
// Entry points
// ============================================================================

Result<ResolvedSchema, SchemaError> SchemaResolver::resolve_text(std::string_view text) const {
    SchemaDocument document;
    try {
        document = SchemaDocument::parse(text.begin(), text.end());
    } catch (const nlohmann::json::parse_error& e) {
        return Result<ResolvedSchema, SchemaError>::error(malformed(e.what()));
    }
    return resolve(document);
}

Result<ResolvedSchema, SchemaError> SchemaResolver::resolve(const SchemaDocument& document) const {
    using R = Result<ResolvedSchema, SchemaError>;
    const utils::Timer timer;

    if (!document.is_object()) {
        return R::error(malformed("schema document is not a JSON object"));
    }
    const auto* defs = member(document, "$defs");
    if (!defs) defs = member(document, "definitions");
    if (!defs) {
        return R::error(malformed("schema document has neither \"$defs\" nor \"definitions\""));
    }
    if (!defs->is_object()) {
        return R::error(malformed("\"$defs\" is not an object"));
    }

    // Pass 1: classify every definition without looking at any other
    RawSet raw;
    std::vector<std::string> order;
    raw.reserve(defs->size());
    order.reserve(defs->size());
    for (const auto& [name, node] : defs->items()) {
        auto classified = classify_definition(name, node);
        if (classified.is_error()) return R::error(classified.err());
        raw.emplace(name, std::move(classified.value()));
        order.push_back(name);
    }

    // Pass 2: alias chains must end in a real definition, since property
    // classification looks through them
    for (const auto& name : order) {
        std::vector<std::string> chain{name};
        const RawDefinition* cur = &raw.at(name);
        while (!cur->alias_of.empty()) {
            const auto it = raw.find(cur->alias_of);
            if (it == raw.end()) {
                return R::error(unresolved(cur->name, cur->alias_of));
            }
            if (std::find(chain.begin(), chain.end(), cur->alias_of) != chain.end()) {
                chain.push_back(cur->alias_of);
                return R::error(cyclic(chain));
            }
            chain.push_back(cur->alias_of);
            cur = &it->second;
        }
    }

    // Pass 3: depth-first merge over the inheritance graph with an explicit stack.
    // IN_PROGRESS entries on the stack form the current inheritance path.
    ResolvedSchema resolved;
    std::unordered_map<std::string, VisitState> state;
    state.reserve(raw.size());
    std::vector<std::string> stack;

    for (const auto& root : order) {
        if (state[root] == VisitState::DONE) continue;
        stack.push_back(root);

        while (!stack.empty()) {
            const std::string current = stack.back();
            auto& st = state[current];

            if (st == VisitState::DONE) {
                stack.pop_back();
                continue;
            }

            const RawDefinition& def = raw.at(current);

            if (st == VisitState::UNVISITED) {
                st = VisitState::IN_PROGRESS;
                bool pushed = false;
                for (auto it = def.parents.rbegin(); it != def.parents.rend(); ++it) {
                    const auto& parent = *it;
                    if (!raw.contains(parent)) {
                        return R::error(unresolved(current, parent));
                    }
                    const auto ps = state[parent];
                    if (ps == VisitState::IN_PROGRESS) {
                        // The topmost entry of the parent is the one being resolved
                        const auto from = std::find(stack.rbegin(), stack.rend(), parent).base() - 1;
                        std::vector<std::string> chain;
                        for (auto s = from; s != stack.end(); ++s) {
                            if (state[*s] == VisitState::IN_PROGRESS) append_unique(chain, *s);
                        }
                        chain.push_back(parent);
                        return R::error(cyclic(chain));
                    }
                    if (ps == VisitState::UNVISITED) {
                        stack.push_back(parent);
                        pushed = true;
                    }
                }
                if (pushed) continue;
            }

            // Every parent is DONE
            auto merged = merge(def, raw, resolved);
            if (merged.is_error()) return R::error(merged.err());
            resolved.emplace(current, std::move(merged.value()));
            state[current] = VisitState::DONE;
            stack.pop_back();
        }
    }

    utils::log::debug(std::format("resolved {} schema definitions in {}",
        resolved.size(), utils::format_duration(timer.elapsed())));
    return R::ok(std::move(resolved));
}

// ============================================================================
// Definitions
// ============================================================================

Result<SchemaResolver::RawDefinition, SchemaError> SchemaResolver::classify_definition(
    const std::string& name, const SchemaDocument& node) const {
    using R = Result<RawDefinition, SchemaError>;

    if (!node.is_object()) {
        return R::error(malformed(std::format("definition \"{}\" is not an object", name)));
    }

    RawDefinition def;
    def.name = name;
    def.node = &node;

    const auto* ref = member(node, "$ref");
    const auto* all_of = member(node, "allOf");
    const auto* props = member(node, "properties");
    const auto* type = member(node, "type");
    const auto* alternatives = member(node, "anyOf");
    if (!alternatives) alternatives = member(node, "oneOf");

    if (ref && !ref->is_string()) {
        return R::error(malformed(std::format("\"$ref\" of \"{}\" is not a string", name)));
    }

    // {"$ref": X}: alias, shape taken from X
    if (ref && !all_of && !props) {
        def.alias_of = ref_target(ref->get<std::string>());
        if (def.alias_of.empty()) return R::error(unresolved(name, ref->get<std::string>()));
        def.parents.push_back(def.alias_of);
        return R::ok(std::move(def));
    }

    // {"anyOf": [{"$ref"}, ...]}: abstract union
    if (alternatives && !all_of && !props) {
        if (!alternatives->is_array() || alternatives->empty()) {
            return R::error(malformed(std::format(
                "union \"{}\" does not list its members in a non-empty array", name)));
        }
        def.shape = DefinitionShape::UNION;
        for (const auto& alt : *alternatives) {
            const auto* alt_ref = member(alt, "$ref");
            if (!alt_ref || !alt_ref->is_string()) {
                return R::error(unsupported(name, "",
                    "anyOf/oneOf definitions may only list $ref members"));
            }
            def.members.push_back(ref_target(alt_ref->get<std::string>()));
        }
        return R::ok(std::move(def));
    }

    if (type && !type->is_string()) {
        return R::error(unsupported(name, "", "definition declares several types"));
    }
    if (type) {
        const auto type_str = type->get<std::string>();
        if (const auto sk = scalar_kind_of(type_str)) {
            if (!all_of && !props) {
                def.shape = DefinitionShape::SCALAR_ALIAS;
                def.scalar_kind = *sk;
                return R::ok(std::move(def));
            }
            return R::error(unsupported(name, "",
                std::format("scalar type \"{}\" with properties", type_str)));
        }
        if (type_str != "object") {
            return R::error(unsupported(name, "", std::format("definition of type \"{}\"", type_str)));
        }
    }
    if (!type && !props && !all_of) {
        return R::error(unsupported(name, "",
            "definition is neither an object, a reference, a union nor a scalar"));
    }

    def.shape = DefinitionShape::OBJECT;
    if (props) {
        if (!props->is_object()) {
            return R::error(malformed(std::format("\"properties\" of \"{}\" is not an object", name)));
        }
        def.steps.push_back(MergeStep{.parent = {}, .block = &node});
    }
    if (ref) {
        auto parent = ref_target(ref->get<std::string>());
        if (parent.empty()) return R::error(unresolved(name, ref->get<std::string>()));
        def.parents.push_back(parent);
        def.steps.push_back(MergeStep{.parent = std::move(parent), .block = nullptr});
    }
    if (all_of) {
        if (!all_of->is_array()) {
            return R::error(malformed(std::format("\"allOf\" of \"{}\" is not an array", name)));
        }
        for (const auto& part : *all_of) {
            if (!part.is_object()) {
                return R::error(malformed(std::format("\"allOf\" of \"{}\" holds a non-object", name)));
            }
            if (const auto* part_ref = member(part, "$ref")) {
                if (!part_ref->is_string()) {
                    return R::error(malformed(std::format("\"$ref\" in \"allOf\" of \"{}\" is not a string", name)));
                }
                auto parent = ref_target(part_ref->get<std::string>());
                if (parent.empty()) return R::error(unresolved(name, part_ref->get<std::string>()));
                def.parents.push_back(parent);
                def.steps.push_back(MergeStep{.parent = std::move(parent), .block = nullptr});
                continue;
            }
            if (member(part, "allOf") || member(part, "anyOf") || member(part, "oneOf")) {
                return R::error(unsupported(name, "", "nested combinator inside allOf"));
            }
            const auto* part_props = member(part, "properties");
            if (!part_props) {
                return R::error(unsupported(name, "", "allOf member without $ref or properties"));
            }
            if (!part_props->is_object()) {
                return R::error(malformed(std::format("\"properties\" in \"allOf\" of \"{}\" is not an object", name)));
            }
            def.steps.push_back(MergeStep{.parent = {}, .block = &part});
        }
    }
    return R::ok(std::move(def));
}

const SchemaResolver::RawDefinition* SchemaResolver::effective(
    const std::string& name, const RawSet& raw) const {
    auto it = raw.find(name);
    for (size_t hops = 0; it != raw.end() && hops <= raw.size(); ++hops) {
        if (it->second.alias_of.empty()) return &it->second;
        it = raw.find(it->second.alias_of);
    }
    return nullptr;
}

Result<SchemaDefinition, SchemaError> SchemaResolver::merge(
    const RawDefinition& def, const RawSet& raw, const ResolvedSchema& done) const {
    using R = Result<SchemaDefinition, SchemaError>;

    SchemaDefinition out;

    if (!def.alias_of.empty()) {
        const auto& target = done.at(def.alias_of);
        out = target;
        out.name = def.name;
        out.supertypes = {def.alias_of};
        out.ancestors = {def.alias_of};
        for (const auto& a : target.ancestors) append_unique(out.ancestors, a);
        if (out.shape == DefinitionShape::OBJECT) out.discriminator = def.name;
        return R::ok(std::move(out));
    }

    out.name = def.name;
    out.shape = def.shape;

    if (def.shape == DefinitionShape::UNION) {
        for (const auto& m : def.members) {
            if (m.empty() || !raw.contains(m)) return R::error(unresolved(def.name, m));
        }
        out.union_members = def.members;
        return R::ok(std::move(out));
    }

    if (def.shape == DefinitionShape::SCALAR_ALIAS) {
        out.scalar_kind = def.scalar_kind;
        return R::ok(std::move(out));
    }

    std::unordered_set<std::string> seen;
    std::optional<std::string> own_tag;

    for (const auto& step : def.steps) {
        if (!step.parent.empty()) {
            const auto& parent = done.at(step.parent);
            if (parent.shape != DefinitionShape::OBJECT) {
                return R::error(unsupported(def.name, "", std::format(
                    "cannot inherit fields from non-object type \"{}\"", step.parent)));
            }
            for (const auto& f : parent.fields) {
                if (seen.insert(f.name).second) out.fields.push_back(f);
            }
            append_unique(out.supertypes, step.parent);
            continue;
        }

        for (const auto& [field_name, prop] : step.block->at("properties").items()) {
            auto field = classify_property(def.name, field_name, prop, raw);
            if (field.is_error()) return R::error(field.err());
            auto fd = std::move(field.value());

            if (!own_tag && field_name == conventions_.type_field && fd.constant) {
                own_tag = fd.constant;
            }
            if (seen.insert(fd.name).second) out.fields.push_back(std::move(fd));
        }
    }

    for (const auto& s : out.supertypes) append_unique(out.ancestors, s);
    for (const auto& s : out.supertypes) {
        for (const auto& a : done.at(s).ancestors) append_unique(out.ancestors, a);
    }

    out.discriminator = own_tag.value_or(def.name);
    return R::ok(std::move(out));
}

// ============================================================================
// Properties
// ============================================================================

Result<FieldDescriptor, SchemaError> SchemaResolver::classify_property(
    const std::string& type_name, const std::string& field_name,
    const SchemaDocument& node, const RawSet& raw) const {
    using R = Result<FieldDescriptor, SchemaError>;

    FieldDescriptor fd;
    fd.name = field_name;

    const auto& poly = conventions_.polymorphic_fields;
    if (std::find(poly.begin(), poly.end(), field_name) != poly.end()) {
        fd.kind = FieldKind::POLYMORPHIC;
        fd.nullable = true;
        return R::ok(std::move(fd));
    }

    if (!node.is_object()) {
        return R::error(malformed(std::format(
            "property \"{}\" of \"{}\" is not an object", field_name, type_name)));
    }

    // Reference to a named type. Only the name is recorded; the target's
    // fields are never expanded here.
    if (const auto* ref = member(node, "$ref")) {
        if (!ref->is_string()) {
            return R::error(malformed(std::format(
                "\"$ref\" of property \"{}\" in \"{}\" is not a string", field_name, type_name)));
        }
        const auto target = ref_target(ref->get<std::string>());
        if (target.empty() || !raw.contains(target)) {
            return R::error(unresolved(type_name, ref->get<std::string>()));
        }
        fd.declared_type = target;
        if (target == conventions_.identity_type) {
            fd.kind = FieldKind::REFERENCE;
            return R::ok(std::move(fd));
        }
        const auto* eff = effective(target, raw);
        if (eff && eff->shape == DefinitionShape::SCALAR_ALIAS) {
            fd.kind = eff->scalar_kind;
            if (fd.kind == FieldKind::STRING) read_string_constraints(*eff->node, fd);
        } else {
            fd.kind = FieldKind::STRUCTURED;
        }
        return R::ok(std::move(fd));
    }

    // Nullable wrapper: oneOf/anyOf [S, {"type": "null"}]
    const auto* alternatives = member(node, "oneOf");
    if (!alternatives) alternatives = member(node, "anyOf");
    if (alternatives) {
        if (!alternatives->is_array()) {
            return R::error(malformed(std::format(
                "combinator of property \"{}\" in \"{}\" is not an array", field_name, type_name)));
        }
        const SchemaDocument* inner = nullptr;
        size_t nulls = 0;
        for (const auto& alt : *alternatives) {
            if (is_null_schema(alt)) {
                ++nulls;
            } else if (inner) {
                return R::error(unsupported(type_name, field_name,
                    "combinator with more than one non-null alternative"));
            } else {
                inner = &alt;
            }
        }
        if (!inner || nulls == 0) {
            return R::error(unsupported(type_name, field_name,
                "combinator that is not a nullable wrapper"));
        }
        auto wrapped = classify_property(type_name, field_name, *inner, raw);
        if (wrapped.is_error()) return wrapped;
        wrapped.value().nullable = true;
        return wrapped;
    }

    if (member(node, "allOf")) {
        return R::error(unsupported(type_name, field_name, "allOf on a property"));
    }

    const auto* type = member(node, "type");
    if (!type) {
        return R::error(unsupported(type_name, field_name, "property without a type"));
    }

    std::string type_str;
    if (type->is_array()) {
        for (const auto& t : *type) {
            if (!t.is_string()) {
                return R::error(malformed(std::format(
                    "\"type\" of property \"{}\" in \"{}\" lists a non-string", field_name, type_name)));
            }
            const auto t_str = t.get<std::string>();
            if (t_str == "null") {
                fd.nullable = true;
            } else if (!type_str.empty()) {
                return R::error(unsupported(type_name, field_name, "property of several types"));
            } else {
                type_str = t_str;
            }
        }
        if (type_str.empty()) {
            return R::error(unsupported(type_name, field_name, "property that is always null"));
        }
    } else if (type->is_string()) {
        type_str = type->get<std::string>();
    } else {
        return R::error(malformed(std::format(
            "\"type\" of property \"{}\" in \"{}\" is neither a string nor an array",
            field_name, type_name)));
    }

    if (const auto sk = scalar_kind_of(type_str)) {
        fd.kind = *sk;
        if (fd.kind == FieldKind::STRING) read_string_constraints(node, fd);
        return R::ok(std::move(fd));
    }

    if (type_str == "object") {
        fd.kind = FieldKind::STRUCTURED;
        return R::ok(std::move(fd));
    }

    if (type_str == "array") {
        fd.kind = FieldKind::STRUCTURED;
        const auto* items = member(node, "items");
        if (!items) return R::ok(std::move(fd));

        // items may itself be a nullable wrapper around the reference
        const SchemaDocument* item = items;
        const auto* item_alts = member(*items, "oneOf");
        if (!item_alts) item_alts = member(*items, "anyOf");
        if (item_alts && item_alts->is_array()) {
            for (const auto& alt : *item_alts) {
                if (!is_null_schema(alt)) {
                    item = &alt;
                    break;
                }
            }
        }
        if (const auto* item_ref = member(*item, "$ref"); item_ref && item_ref->is_string()) {
            const auto target = ref_target(item_ref->get<std::string>());
            if (target.empty() || !raw.contains(target)) {
                return R::error(unresolved(type_name, item_ref->get<std::string>()));
            }
            fd.declared_type = target;
            if (target == conventions_.identity_type) fd.kind = FieldKind::REFERENCE_LIST;
        }
        return R::ok(std::move(fd));
    }

    return R::error(unsupported(type_name, field_name, std::format("property of type \"{}\"", type_str)));
}

} // namespace sysmlsql
