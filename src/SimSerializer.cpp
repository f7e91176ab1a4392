// SimSerializer.cpp – pugixml writer and reader for the SIM and its report.

#include "SIMForge/SimSerializer.hpp"
#include "SIMForge/Validator.hpp"

#include <pugixml.hpp>

#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <sstream>

namespace simforge {

// ─────────────────────────────────────────────────────────────────────────────
//  Writer
// ─────────────────────────────────────────────────────────────────────────────

static void writeField(pugi::xml_node parent, const FieldRecord& f) {
    pugi::xml_node n = parent.append_child("field");
    n.append_attribute("name")     = f.name.c_str();
    n.append_attribute("start")    = f.range.start;
    n.append_attribute("end")      = f.range.end;
    n.append_attribute("encoding") = toString(f.encoding);
    if (f.unit) {
        n.append_attribute("units")         = f.unit->c_str();
        n.append_attribute("unit_resolved") = f.unit_resolved;
    }
    n.append_attribute("confidence").set_value(f.confidence);
    n.append_attribute("nullable") = f.nullable;
    if (f.enum_ref)   n.append_attribute("enum_ref")   = f.enum_ref->c_str();
    if (f.resolution) n.append_attribute("resolution") = f.resolution->c_str();
    n.append_attribute("page") = f.source_page;
    n.append_attribute("row")  = f.source_row;
    if (!f.description.empty())
        n.append_child("description").text() = f.description.c_str();
}

static void writeModel(pugi::xml_document& doc, const SemanticModel& model) {
    auto decl = doc.append_child(pugi::node_declaration);
    decl.append_attribute("version")  = "1.0";
    decl.append_attribute("encoding") = "UTF-8";

    pugi::xml_node root = doc.append_child("sim");
    root.append_attribute("standard")       = model.document.standard.c_str();
    root.append_attribute("edition")        = model.document.edition.c_str();
    root.append_attribute("transport_unit") = toString(model.document.transport_unit);
    root.append_attribute("page_count")     = model.document.page_count;

    pugi::xml_node messages = root.append_child("messages");
    for (const auto& m : model.messages) {
        pugi::xml_node mn = messages.append_child("message");
        mn.append_attribute("label")      = m.label.c_str();
        mn.append_attribute("title")      = m.title.c_str();
        mn.append_attribute("edition")    = m.edition.c_str();
        mn.append_attribute("first_page") = m.first_page;
        pugi::xml_node segs = mn.append_child("segments");
        for (const auto& s : m.segments) {
            pugi::xml_node sn = segs.append_child("segment");
            sn.append_attribute("type")       = s.type.c_str();
            sn.append_attribute("index")      = s.index;
            sn.append_attribute("bit_length") = s.bit_length;
            sn.append_attribute("declared")   = s.declared;
            pugi::xml_node fields = sn.append_child("fields");
            for (const auto& f : s.fields) writeField(fields, f);
        }
    }

    pugi::xml_node dict = root.append_child("dictionary");
    for (const auto& e : model.dictionary) {
        pugi::xml_node en = dict.append_child("entry");
        en.append_attribute("key")             = e.key.c_str();
        en.append_attribute("parent")          = e.parent.c_str();
        en.append_attribute("level")           = toString(e.level);
        en.append_attribute("category_id")     = e.category_id;
        en.append_attribute("sub_category_id") = e.sub_category_id;
        en.append_attribute("item_id")         = e.item_id;
        en.append_attribute("name")            = e.name.c_str();
        if (!e.description.empty())
            en.append_attribute("description") = e.description.c_str();
    }

    pugi::xml_node enums = root.append_child("enums");
    for (const auto& def : model.enums) {
        pugi::xml_node dn = enums.append_child("enum");
        dn.append_attribute("key") = def.key.c_str();
        for (const auto& v : def.values) {
            pugi::xml_node vn = dn.append_child("value");
            vn.append_attribute("code")  = v.code.c_str();
            vn.append_attribute("label") = v.label.c_str();
        }
    }

    pugi::xml_node units = root.append_child("units");
    for (const auto& u : model.units) {
        pugi::xml_node un = units.append_child("unit");
        un.append_attribute("symbol")  = u.symbol.c_str();
        un.append_attribute("base_si") = u.base_si.c_str();
        un.append_attribute("factor").set_value(u.factor);
        un.append_attribute("offset").set_value(u.offset);
        un.append_attribute("description") = u.description.c_str();
        for (const auto& a : u.aliases)
            un.append_child("alias").text() = a.c_str();
    }
}

std::string toXml(const SemanticModel& model) {
    pugi::xml_document doc;
    writeModel(doc, model);
    std::ostringstream os;
    doc.save(os, "  ", pugi::format_default, pugi::encoding_utf8);
    return os.str();
}

static bool isJsonPath(const std::filesystem::path& path) {
    return path.extension() == ".json";
}

void saveSim(const SemanticModel& model, const std::filesystem::path& path) {
    if (isJsonPath(path)) {
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        out << toJson(model);
        if (!out)
            throw std::runtime_error("Cannot write SIM file '" + path.string() + "'");
        return;
    }
    pugi::xml_document doc;
    writeModel(doc, model);
    if (!doc.save_file(path.c_str(), "  ", pugi::format_default, pugi::encoding_utf8))
        throw std::runtime_error("Cannot write SIM file '" + path.string() + "'");
}

// ─────────────────────────────────────────────────────────────────────────────
//  Reader
// ─────────────────────────────────────────────────────────────────────────────

static const char* requireAttr(pugi::xml_node n, const char* name) {
    pugi::xml_attribute a = n.attribute(name);
    if (!a)
        throw SimFormatError(std::string("<") + n.name() + "> missing '" + name + "' attribute");
    return a.value();
}

static int32_t requireInt(pugi::xml_node n, const char* name) {
    const char* s = requireAttr(n, name);
    char* end = nullptr;
    const long v = std::strtol(s, &end, 10);
    if (end == s || *end != '\0' || v < INT32_MIN || v > INT32_MAX)
        throw SimFormatError(std::string("<") + n.name() + "> attribute '" + name +
                             "' is not an integer: '" + s + "'");
    return static_cast<int32_t>(v);
}

static uint32_t requireUint(pugi::xml_node n, const char* name) {
    const char* s = requireAttr(n, name);
    char* end = nullptr;
    const long long v = std::strtoll(s, &end, 10);
    if (end == s || *end != '\0')
        throw SimFormatError(std::string("<") + n.name() + "> attribute '" + name +
                             "' is not an integer: '" + s + "'");
    if (v < 0)
        throw SimFormatError(std::string("<") + n.name() + "> attribute '" + name + "' is negative");
    if (v > UINT32_MAX)
        throw SimFormatError(std::string("<") + n.name() + "> attribute '" + name + "' is out of range");
    return static_cast<uint32_t>(v);
}

static uint32_t optionalUint(pugi::xml_node n, const char* name) {
    return n.attribute(name) ? requireUint(n, name) : 0;
}

static FieldRecord readField(pugi::xml_node n) {
    FieldRecord f;
    f.name        = requireAttr(n, "name");
    f.range.start = requireInt(n, "start");
    f.range.end   = requireInt(n, "end");
    if (f.range.start < 0 || f.range.start > f.range.end)
        throw SimFormatError("field '" + f.name + "' has an invalid range");

    const char* enc = requireAttr(n, "encoding");
    auto encoding = parseFieldEncoding(enc);
    if (!encoding)
        throw SimFormatError("field '" + f.name + "' has unknown encoding '" + enc + "'");
    f.encoding = *encoding;

    if (auto a = n.attribute("units")) {
        f.unit          = a.value();
        f.unit_resolved = n.attribute("unit_resolved").as_bool(true);
    }
    f.confidence = n.attribute("confidence").as_double(0.0);
    f.nullable   = n.attribute("nullable").as_bool(false);
    if (auto a = n.attribute("enum_ref"))   f.enum_ref   = a.value();
    if (auto a = n.attribute("resolution")) f.resolution = a.value();
    f.source_page = optionalUint(n, "page");
    f.source_row  = optionalUint(n, "row");
    f.description = n.child("description").text().as_string();
    return f;
}

static SemanticModel readModel(const pugi::xml_document& doc) {
    pugi::xml_node root = doc.child("sim");
    if (!root) throw SimFormatError("XML root element must be <sim>");

    SemanticModel model;
    model.document.standard = requireAttr(root, "standard");
    model.document.edition  = root.attribute("edition").as_string();
    const char* tu = requireAttr(root, "transport_unit");
    auto unit = parseTransportUnit(tu);
    if (!unit) throw SimFormatError(std::string("Unknown transport_unit '") + tu + "'");
    model.document.transport_unit = *unit;
    model.document.page_count     = optionalUint(root, "page_count");

    for (auto mn : root.child("messages").children("message")) {
        Message m;
        m.label      = requireAttr(mn, "label");
        m.title      = mn.attribute("title").as_string();
        m.edition    = mn.attribute("edition").as_string();
        m.first_page = optionalUint(mn, "first_page");
        for (auto sn : mn.child("segments").children("segment")) {
            Segment s;
            s.type       = requireAttr(sn, "type");
            s.index      = requireUint(sn, "index");
            s.bit_length = requireUint(sn, "bit_length");
            s.declared   = sn.attribute("declared").as_bool(false);
            for (auto fn : sn.child("fields").children("field"))
                s.fields.push_back(readField(fn));
            m.segments.push_back(std::move(s));
        }
        model.messages.push_back(std::move(m));
    }

    for (auto en : root.child("dictionary").children("entry")) {
        DictionaryEntry e;
        e.key    = requireAttr(en, "key");
        e.parent = en.attribute("parent").as_string();
        const char* lvl = requireAttr(en, "level");
        auto level = parseDictionaryLevel(lvl);
        if (!level) throw SimFormatError("entry '" + e.key + "' has unknown level '" + lvl + "'");
        e.level           = *level;
        e.category_id     = optionalUint(en, "category_id");
        e.sub_category_id = optionalUint(en, "sub_category_id");
        e.item_id         = optionalUint(en, "item_id");
        e.name            = en.attribute("name").as_string();
        e.description     = en.attribute("description").as_string();
        model.dictionary.push_back(std::move(e));
    }

    for (auto dn : root.child("enums").children("enum")) {
        EnumDefinition def;
        def.key = requireAttr(dn, "key");
        for (auto vn : dn.children("value"))
            def.values.push_back({requireAttr(vn, "code"), vn.attribute("label").as_string()});
        model.enums.push_back(std::move(def));
    }

    for (auto un : root.child("units").children("unit")) {
        UnitDefinition u;
        u.symbol      = requireAttr(un, "symbol");
        u.base_si     = un.attribute("base_si").as_string();
        u.factor      = un.attribute("factor").as_double(1.0);
        u.offset      = un.attribute("offset").as_double(0.0);
        u.description = un.attribute("description").as_string();
        for (auto an : un.children("alias")) u.aliases.emplace_back(an.text().as_string());
        model.units.push_back(std::move(u));
    }
    return model;
}

SemanticModel fromXml(std::string_view xml) {
    pugi::xml_document doc;
    pugi::xml_parse_result result = doc.load_buffer(xml.data(), xml.size());
    if (!result)
        throw SimFormatError(std::string("Failed to parse SIM XML: ") + result.description());
    return readModel(doc);
}

SemanticModel loadSim(const std::filesystem::path& path) {
    if (isJsonPath(path)) {
        std::ifstream in(path, std::ios::binary);
        if (!in) throw SimFormatError("Cannot read SIM file '" + path.string() + "'");
        std::ostringstream text;
        text << in.rdbuf();
        return fromJson(text.str());
    }
    pugi::xml_document doc;
    pugi::xml_parse_result result = doc.load_file(path.c_str());
    if (!result)
        throw SimFormatError("Failed to parse SIM file '" + path.string() + "': " +
                             result.description());
    return readModel(doc);
}

// ─────────────────────────────────────────────────────────────────────────────
//  Report
// ─────────────────────────────────────────────────────────────────────────────

std::string reportToXml(const std::vector<ValidationIssue>& issues) {
    pugi::xml_document doc;
    pugi::xml_node root = doc.append_child("report");
    root.append_attribute("errors")   = static_cast<unsigned>(countIssues(issues, Severity::Error));
    root.append_attribute("warnings") = static_cast<unsigned>(countIssues(issues, Severity::Warning));
    root.append_attribute("info")     = static_cast<unsigned>(countIssues(issues, Severity::Info));
    for (const auto& i : issues) {
        pugi::xml_node n = root.append_child("issue");
        n.append_attribute("severity")    = toString(i.severity);
        n.append_attribute("rule_id")     = i.rule_id.c_str();
        n.append_attribute("target_path") = i.target_path.c_str();
        n.append_attribute("message")     = i.message.c_str();
        if (i.suggested_fix)
            n.append_attribute("suggested_fix") = i.suggested_fix->c_str();
    }
    std::ostringstream os;
    doc.save(os, "  ", pugi::format_default, pugi::encoding_utf8);
    return os.str();
}

std::string formatReport(const std::vector<ValidationIssue>& issues, const Diagnostics& diagnostics) {
    std::ostringstream os;
    const size_t errors   = countIssues(issues, Severity::Error);
    const size_t warnings = countIssues(issues, Severity::Warning);
    const size_t info     = countIssues(issues, Severity::Info);

    os << "Validation report: " << errors << " errors, " << warnings << " warnings, "
       << info << " info\n";

    for (Severity sev : {Severity::Error, Severity::Warning, Severity::Info}) {
        if (countIssues(issues, sev) == 0) continue;
        os << "\n── " << toString(sev) << " ──\n";
        for (const auto& i : issues) {
            if (i.severity != sev) continue;
            os << "  [" << i.rule_id << "] " << i.target_path << ": " << i.message << '\n';
            if (i.suggested_fix) os << "      fix: " << *i.suggested_fix << '\n';
        }
    }

    os << "\nCoverage: " << diagnostics.tables_selected << '/' << diagnostics.regions
       << " regions (" << std::fixed << std::setprecision(1) << diagnostics.coverage() * 100.0
       << "%), " << diagnostics.gaps.size() << " gaps, " << diagnostics.skipped.size()
       << " skipped rows\n";
    os << "Fields: " << diagnostics.field_count << ", mean confidence "
       << std::setprecision(3) << diagnostics.mean_confidence << '\n';
    return os.str();
}

} // namespace simforge
