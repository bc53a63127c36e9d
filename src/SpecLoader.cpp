// SpecLoader.cpp – Parses the FM-12 XML code book into a CodeBook.
// Uses pugixml for robust, zero-copy XML parsing.

#include "SynopCodec/SpecLoader.hpp"
#include "SynopCodec/CodeTables.hpp"

#include <pugixml.hpp>

#include <charconv>
#include <cstring>
#include <sstream>
#include <string>

namespace synop {

// ─── Small parsing helpers ────────────────────────────────────────────────────

static int parseInt(const char* s, const char* ctx) {
    int v = 0;
    auto [ptr, ec] = std::from_chars(s, s + std::strlen(s), v);
    if (ec != std::errc{} || *ptr != '\0')
        throw SpecLoadError(std::string(ctx) + ": cannot parse int '" + s + "'");
    return v;
}

static double parseDouble(const char* s, const char* ctx) {
    char* end = nullptr;
    double v = std::strtod(s, &end);
    if (end == s)
        throw SpecLoadError(std::string(ctx) + ": cannot parse double '" + s + "'");
    return v;
}

static TableKind parseKind(const char* s) {
    if (!s || *s == '\0')              return TableKind::Simple;
    if (strcmp(s, "simple")   == 0)    return TableKind::Simple;
    if (strcmp(s, "lookup")   == 0)    return TableKind::Lookup;
    if (strcmp(s, "range")    == 0)    return TableKind::Range;
    if (strcmp(s, "flags")    == 0)    return TableKind::Flags;
    throw SpecLoadError(std::string("Unknown table kind: '") + s + "'");
}

static Quantifier parseQuantifier(const char* s) {
    if (!s || *s == '\0')                      return Quantifier::None;
    if (strcmp(s, "isLess")           == 0)    return Quantifier::IsLess;
    if (strcmp(s, "isGreater")        == 0)    return Quantifier::IsGreater;
    if (strcmp(s, "isGreaterOrEqual") == 0)    return Quantifier::IsGreaterOrEqual;
    throw SpecLoadError(std::string("Unknown quantifier: '") + s + "'");
}

// ─── Parse one <Entry> of a table ─────────────────────────────────────────────

static TableEntry parseEntry(pugi::xml_node node, const std::vector<std::string>& default_flags) {
    TableEntry e;
    e.code = parseInt(node.attribute("code").as_string(""), "Entry.code");

    if (auto a = node.attribute("value"); a) e.number = parseDouble(a.as_string(), "Entry.value");
    if (auto a = node.attribute("min");   a) e.min    = parseDouble(a.as_string(), "Entry.min");
    if (auto a = node.attribute("max");   a) e.max    = parseDouble(a.as_string(), "Entry.max");
    e.text       = node.attribute("text").as_string("");
    e.quantifier = parseQuantifier(node.attribute("quantifier").as_string(""));

    for (const auto& f : default_flags) e.flags[f] = false;
    for (auto flag : node.children("Flag")) {
        std::string name = flag.attribute("name").as_string("");
        if (name.empty())
            throw SpecLoadError("<Flag> missing 'name' attribute");
        e.flags[name] = flag.attribute("value").as_bool(true);
    }
    return e;
}

// ─── Parse one <Table> node ───────────────────────────────────────────────────

static TableDef parseTable(pugi::xml_node node) {
    TableDef t;
    t.id          = node.attribute("id").as_string("");
    t.name        = node.attribute("name").as_string("");
    t.kind        = parseKind(node.attribute("kind").as_string("simple"));
    t.width       = static_cast<uint16_t>(parseInt(node.attribute("width").as_string("1"), "Table.width"));
    t.unit        = node.attribute("unit").as_string("");
    t.decode_only = node.attribute("decode_only").as_bool(false);

    if (t.id.empty())
        throw SpecLoadError("<Table> missing 'id' attribute");
    if (t.width == 0 || t.width > 4)
        throw SpecLoadError("Table '" + t.id + "' width must be 1–4");
    if (CodeTables::isBuiltin(t.id))
        throw SpecLoadError("Table '" + t.id + "' is built in and cannot be redefined");

    if (t.kind == TableKind::Simple) {
        t.min_code = parseInt(node.attribute("min").as_string("0"), "Table.min");
        t.max_code = parseInt(node.attribute("max").as_string("9"), "Table.max");
        if (t.min_code > t.max_code)
            throw SpecLoadError("Table '" + t.id + "' has min > max");
        return t;
    }

    // Flag names listed on the table default to false on every entry
    std::vector<std::string> default_flags;
    std::istringstream flag_list(node.attribute("flags").as_string(""));
    for (std::string f; flag_list >> f;) default_flags.push_back(f);

    for (auto entry_node : node.children("Entry")) {
        TableEntry e = parseEntry(entry_node, default_flags);
        if (!t.entries.emplace(e.code, e).second)
            throw SpecLoadError("Table '" + t.id + "' has duplicate code " + std::to_string(e.code));
    }
    if (t.entries.empty())
        throw SpecLoadError("Table '" + t.id + "' has no <Entry> children");

    return t;
}

// ─── Parse one <Element> of a group layout ────────────────────────────────────

static ElementDef parseElementNode(pugi::xml_node node) {
    ElementDef e;
    e.name  = node.attribute("name").as_string("");
    e.width = static_cast<uint16_t>(parseInt(node.attribute("width").as_string("0"), "Element.width"));
    e.table = node.attribute("table").as_string("");

    if (e.name.empty())
        throw SpecLoadError("<Element> missing 'name' attribute");
    if (e.width == 0)
        throw SpecLoadError("Element '" + e.name + "' has width=0");

    if (auto a = node.attribute("scale"); a) e.scale = parseDouble(a.as_string(), "scale");
    if (auto a = node.attribute("unit");  a) e.unit  = a.as_string();
    if (auto a = node.attribute("min");   a) e.min_code = parseInt(a.as_string(), "Element.min");
    if (auto a = node.attribute("max");   a) e.max_code = parseInt(a.as_string(), "Element.max");
    return e;
}

// ─── Parse one <Group> node ───────────────────────────────────────────────────

static GroupDef parseGroup(pugi::xml_node node, const CodeBook& book) {
    GroupDef g;
    g.header  = node.attribute("header").as_string("");
    g.section = parseInt(node.attribute("section").as_string("0"), "Group.section");
    g.name    = node.attribute("name").as_string("");

    const char* field = node.attribute("field").as_string("");
    auto f = fieldFromName(field);
    if (!f)
        throw SpecLoadError(std::string("Group '") + g.header + "' has unknown field '" + field + "'");
    g.field = *f;

    if (g.header.empty() || g.header.size() >= 5)
        throw SpecLoadError("<Group> header must be 1–4 characters");
    if (g.section < 1 || g.section > 3)
        throw SpecLoadError("Group '" + g.header + "' section must be 1, 2 or 3");

    size_t width = 0;
    const CodeTables tables(book);
    for (auto el : node.children("Element")) {
        ElementDef e = parseElementNode(el);
        if (!e.table.empty()) {
            if (!tables.contains(e.table))
                throw SpecLoadError("Element '" + e.name + "' references unknown table '" + e.table + "'");
            if (tables.width(e.table) != e.width)
                throw SpecLoadError("Element '" + e.name + "' width does not match table '" + e.table + "'");
        }
        width += e.width;
        g.elements.push_back(std::move(e));
    }
    if (width + g.header.size() != 5)
        throw SpecLoadError("Group '" + g.header + "' elements cover " + std::to_string(width) +
                            " characters, expected " + std::to_string(5 - g.header.size()));
    return g;
}

// ─── Public entry point ───────────────────────────────────────────────────────

CodeBook loadSpec(const std::filesystem::path& xml_path) {
    pugi::xml_document doc;
    pugi::xml_parse_result result = doc.load_file(xml_path.c_str());
    if (!result)
        throw SpecLoadError("Failed to parse XML '" + xml_path.string() +
                            "': " + result.description());

    pugi::xml_node root = doc.child("CodeBook");
    if (!root)
        throw SpecLoadError("XML root element must be <CodeBook>");

    CodeBook book;
    book.edition = root.attribute("edition").as_string("");
    book.date    = root.attribute("date").as_string("");

    for (auto table_node : root.child("Tables").children("Table")) {
        TableDef t = parseTable(table_node);
        const std::string id = t.id;
        if (!book.tables.emplace(id, std::move(t)).second)
            throw SpecLoadError("Duplicate table '" + id + "'");
    }
    if (book.tables.empty())
        throw SpecLoadError("No <Tables> entries found in '" + xml_path.string() + "'");

    // Groups reference tables, so they are parsed second
    for (auto group_node : root.child("Groups").children("Group")) {
        GroupDef g = parseGroup(group_node, book);
        auto& by_header = book.groups[g.section];
        const std::string header = g.header;
        if (!by_header.emplace(header, std::move(g)).second)
            throw SpecLoadError("Duplicate group header '" + header + "'");
    }

    return book;
}

} // namespace synop
