// SimJson.cpp – nlohmann/json writer and reader for the SIM.

#include "SIMForge/SimSerializer.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cstdint>
#include <limits>

namespace simforge {

// Insertion order keeps the key layout stable across runs.
using json = nlohmann::ordered_json;

// ─────────────────────────────────────────────────────────────────────────────
//  Writer
// ─────────────────────────────────────────────────────────────────────────────

static json fieldToJson(const FieldRecord& f) {
    json j;
    j["name"]     = f.name;
    j["start"]    = f.range.start;
    j["end"]      = f.range.end;
    j["encoding"] = toString(f.encoding);
    if (f.unit) {
        j["units"]         = *f.unit;
        j["unit_resolved"] = f.unit_resolved;
    }
    j["confidence"] = f.confidence;
    j["nullable"]   = f.nullable;
    if (f.enum_ref)   j["enum_ref"]   = *f.enum_ref;
    if (f.resolution) j["resolution"] = *f.resolution;
    j["page"] = f.source_page;
    j["row"]  = f.source_row;
    if (!f.description.empty()) j["description"] = f.description;
    return j;
}

std::string toJson(const SemanticModel& model) {
    json root;
    root["standard"]       = model.document.standard;
    root["edition"]        = model.document.edition;
    root["transport_unit"] = toString(model.document.transport_unit);
    root["page_count"]     = model.document.page_count;

    json messages = json::array();
    for (const auto& m : model.messages) {
        json mj;
        mj["label"]      = m.label;
        mj["title"]      = m.title;
        mj["edition"]    = m.edition;
        mj["first_page"] = m.first_page;
        json segs = json::array();
        for (const auto& s : m.segments) {
            json sj;
            sj["type"]       = s.type;
            sj["index"]      = s.index;
            sj["bit_length"] = s.bit_length;
            sj["declared"]   = s.declared;
            json fields = json::array();
            for (const auto& f : s.fields) fields.push_back(fieldToJson(f));
            sj["fields"] = std::move(fields);
            segs.push_back(std::move(sj));
        }
        mj["segments"] = std::move(segs);
        messages.push_back(std::move(mj));
    }
    root["messages"] = std::move(messages);

    json dict = json::array();
    for (const auto& e : model.dictionary) {
        json ej;
        ej["key"]             = e.key;
        ej["parent"]          = e.parent;
        ej["level"]           = toString(e.level);
        ej["category_id"]     = e.category_id;
        ej["sub_category_id"] = e.sub_category_id;
        ej["item_id"]         = e.item_id;
        ej["name"]            = e.name;
        if (!e.description.empty()) ej["description"] = e.description;
        dict.push_back(std::move(ej));
    }
    root["dictionary"] = std::move(dict);

    json enums = json::array();
    for (const auto& def : model.enums) {
        json values = json::array();
        for (const auto& v : def.values)
            values.push_back(json{{"code", v.code}, {"label", v.label}});
        enums.push_back(json{{"key", def.key}, {"values", std::move(values)}});
    }
    root["enums"] = std::move(enums);

    json units = json::array();
    for (const auto& u : model.units) {
        json uj;
        uj["symbol"]      = u.symbol;
        uj["base_si"]     = u.base_si;
        uj["factor"]      = u.factor;
        uj["offset"]      = u.offset;
        uj["description"] = u.description;
        uj["aliases"]     = u.aliases;
        units.push_back(std::move(uj));
    }
    root["units"] = std::move(units);

    // Text lifted from PDFs is not guaranteed to be valid UTF-8.
    return root.dump(2, ' ', false, json::error_handler_t::replace) + '\n';
}

// ─────────────────────────────────────────────────────────────────────────────
//  Reader
// ─────────────────────────────────────────────────────────────────────────────

static const json& require(const json& obj, const char* key, const char* where) {
    auto it = obj.find(key);
    if (it == obj.end())
        throw SimFormatError(std::string(where) + " missing '" + key + "'");
    return *it;
}

static std::string requireString(const json& obj, const char* key, const char* where) {
    const json& v = require(obj, key, where);
    if (!v.is_string())
        throw SimFormatError(std::string(where) + " '" + key + "' is not a string");
    return v.get<std::string>();
}

static int64_t requireInteger(const json& obj, const char* key, const char* where,
                              int64_t lo, int64_t hi) {
    const json& v = require(obj, key, where);
    if (!v.is_number_integer())
        throw SimFormatError(std::string(where) + " '" + key + "' is not an integer");
    const int64_t n = v.is_number_unsigned()
                          ? static_cast<int64_t>(std::min<uint64_t>(
                                  v.get<uint64_t>(),
                                  static_cast<uint64_t>(std::numeric_limits<int64_t>::max())))
                          : v.get<int64_t>();
    if (n < lo || n > hi)
        throw SimFormatError(std::string(where) + " '" + key + "' is out of range");
    return n;
}

static uint32_t optionalUint(const json& obj, const char* key, const char* where) {
    if (!obj.contains(key)) return 0;
    return static_cast<uint32_t>(
        requireInteger(obj, key, where, 0, std::numeric_limits<uint32_t>::max()));
}

// Absent arrays read as empty.
static const json& arrayOf(const json& obj, const char* key, const char* where) {
    static const json empty = json::array();
    auto it = obj.find(key);
    if (it == obj.end()) return empty;
    if (!it->is_array())
        throw SimFormatError(std::string(where) + " '" + key + "' is not an array");
    return *it;
}

static const json& objectAt(const json& v, const char* where) {
    if (!v.is_object()) throw SimFormatError(std::string(where) + " entry is not an object");
    return v;
}

static FieldRecord fieldFromJson(const json& j) {
    FieldRecord f;
    f.name = requireString(j, "name", "field");
    const std::string where = "field '" + f.name + "'";
    constexpr int64_t kMax = std::numeric_limits<int32_t>::max();
    f.range.start = static_cast<int32_t>(requireInteger(j, "start", where.c_str(), 0, kMax));
    f.range.end   = static_cast<int32_t>(requireInteger(j, "end", where.c_str(), 0, kMax));
    if (f.range.start > f.range.end)
        throw SimFormatError(where + " has an invalid range");

    const std::string enc = requireString(j, "encoding", where.c_str());
    auto encoding = parseFieldEncoding(enc);
    if (!encoding) throw SimFormatError(where + " has unknown encoding '" + enc + "'");
    f.encoding = *encoding;

    if (j.contains("units")) {
        f.unit          = requireString(j, "units", where.c_str());
        f.unit_resolved = j.value("unit_resolved", true);
    }
    f.confidence = j.value("confidence", 0.0);
    f.nullable   = j.value("nullable", false);
    if (j.contains("enum_ref"))   f.enum_ref   = requireString(j, "enum_ref", where.c_str());
    if (j.contains("resolution")) f.resolution = requireString(j, "resolution", where.c_str());
    f.source_page = optionalUint(j, "page", where.c_str());
    f.source_row  = optionalUint(j, "row", where.c_str());
    f.description = j.value("description", std::string{});
    return f;
}

static SemanticModel modelFromJson(const json& root) {
    if (!root.is_object()) throw SimFormatError("SIM JSON root must be an object");

    SemanticModel model;
    model.document.standard = requireString(root, "standard", "sim");
    model.document.edition  = root.value("edition", std::string{});
    const std::string tu = requireString(root, "transport_unit", "sim");
    auto unit = parseTransportUnit(tu);
    if (!unit) throw SimFormatError("Unknown transport_unit '" + tu + "'");
    model.document.transport_unit = *unit;
    model.document.page_count     = optionalUint(root, "page_count", "sim");

    for (const auto& mv : arrayOf(root, "messages", "sim")) {
        const json& mj = objectAt(mv, "message");
        Message m;
        m.label      = requireString(mj, "label", "message");
        m.title      = mj.value("title", std::string{});
        m.edition    = mj.value("edition", std::string{});
        m.first_page = optionalUint(mj, "first_page", "message");
        for (const auto& sv : arrayOf(mj, "segments", "message")) {
            const json& sj = objectAt(sv, "segment");
            Segment s;
            s.type       = requireString(sj, "type", "segment");
            s.index      = static_cast<uint32_t>(
                requireInteger(sj, "index", "segment", 0, std::numeric_limits<uint32_t>::max()));
            s.bit_length = static_cast<uint32_t>(
                requireInteger(sj, "bit_length", "segment", 0, std::numeric_limits<uint32_t>::max()));
            s.declared   = sj.value("declared", false);
            for (const auto& fv : arrayOf(sj, "fields", "segment"))
                s.fields.push_back(fieldFromJson(objectAt(fv, "field")));
            m.segments.push_back(std::move(s));
        }
        model.messages.push_back(std::move(m));
    }

    for (const auto& ev : arrayOf(root, "dictionary", "sim")) {
        const json& ej = objectAt(ev, "dictionary");
        DictionaryEntry e;
        e.key    = requireString(ej, "key", "entry");
        e.parent = ej.value("parent", std::string{});
        const std::string lvl = requireString(ej, "level", "entry");
        auto level = parseDictionaryLevel(lvl);
        if (!level) throw SimFormatError("entry '" + e.key + "' has unknown level '" + lvl + "'");
        e.level           = *level;
        e.category_id     = optionalUint(ej, "category_id", "entry");
        e.sub_category_id = optionalUint(ej, "sub_category_id", "entry");
        e.item_id         = optionalUint(ej, "item_id", "entry");
        e.name            = ej.value("name", std::string{});
        e.description     = ej.value("description", std::string{});
        model.dictionary.push_back(std::move(e));
    }

    for (const auto& dv : arrayOf(root, "enums", "sim")) {
        const json& dj = objectAt(dv, "enum");
        EnumDefinition def;
        def.key = requireString(dj, "key", "enum");
        for (const auto& vv : arrayOf(dj, "values", "enum")) {
            const json& vj = objectAt(vv, "value");
            def.values.push_back({requireString(vj, "code", "value"),
                                  vj.value("label", std::string{})});
        }
        model.enums.push_back(std::move(def));
    }

    for (const auto& uv : arrayOf(root, "units", "sim")) {
        const json& uj = objectAt(uv, "unit");
        UnitDefinition u;
        u.symbol      = requireString(uj, "symbol", "unit");
        u.base_si     = uj.value("base_si", std::string{});
        u.factor      = uj.value("factor", 1.0);
        u.offset      = uj.value("offset", 0.0);
        u.description = uj.value("description", std::string{});
        for (const auto& a : arrayOf(uj, "aliases", "unit")) u.aliases.push_back(a.get<std::string>());
        model.units.push_back(std::move(u));
    }
    return model;
}

SemanticModel fromJson(std::string_view text) {
    try {
        return modelFromJson(json::parse(text.begin(), text.end()));
    } catch (const json::exception& e) {
        // Parse errors and type mismatches inside value()/get().
        throw SimFormatError(std::string("Failed to parse SIM JSON: ") + e.what());
    }
}

} // namespace simforge
