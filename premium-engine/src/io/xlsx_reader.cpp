#include "xlsx_reader.hpp"
#include "../premium_table.hpp"
#include <libxml/parser.h>
#include <libxml/tree.h>
#include <cctype>
#include <memory>
#include <mutex>
#include <optional>

namespace premium {
namespace io {

namespace {

const char* const WORKBOOK_PART = "xl/workbook.xml";
const char* const WORKBOOK_RELS_PART = "xl/_rels/workbook.xml.rels";
const char* const SHARED_STRINGS_PART = "xl/sharedStrings.xml";
const char* const RELATIONSHIPS_NS =
    "http://schemas.openxmlformats.org/officeDocument/2006/relationships";

struct XmlDocDeleter {
    void operator()(xmlDoc* doc) const { xmlFreeDoc(doc); }
};
using XmlDocPtr = std::unique_ptr<xmlDoc, XmlDocDeleter>;

void init_libxml() {
    static std::once_flag once;
    std::call_once(once, [] { xmlInitParser(); });
}

ZipArchive open_archive(const std::string& filepath) {
    try {
        return ZipArchive::open(filepath);
    } catch (const ZipError& e) {
        throw TableLoadError(std::string("Cannot read workbook: ") + e.what());
    }
}

XmlDocPtr parse_part(const ZipArchive& archive, const std::string& part) {
    std::string content;
    try {
        content = archive.read(part);
    } catch (const ZipError& e) {
        throw TableLoadError(std::string("Cannot read workbook part: ") + e.what());
    }

    xmlDoc* doc = xmlReadMemory(content.data(), static_cast<int>(content.size()), part.c_str(),
                                nullptr,
                                XML_PARSE_NONET | XML_PARSE_NOERROR | XML_PARSE_NOWARNING |
                                XML_PARSE_HUGE);
    if (doc == nullptr || xmlDocGetRootElement(doc) == nullptr) {
        if (doc) xmlFreeDoc(doc);
        throw TableLoadError("Malformed XML in workbook part " + part);
    }
    return XmlDocPtr(doc);
}

bool is_element(const xmlNode* node, const char* local_name) {
    return node->type == XML_ELEMENT_NODE &&
           xmlStrcmp(node->name, reinterpret_cast<const xmlChar*>(local_name)) == 0;
}

const xmlNode* first_child(const xmlNode* parent, const char* local_name) {
    for (const xmlNode* child = parent->children; child; child = child->next) {
        if (is_element(child, local_name)) {
            return child;
        }
    }
    return nullptr;
}

std::optional<std::string> attribute(const xmlNode* node, const char* name,
                                     const char* ns = nullptr) {
    const xmlChar* xml_name = reinterpret_cast<const xmlChar*>(name);
    xmlChar* value = ns ? xmlGetNsProp(node, xml_name, reinterpret_cast<const xmlChar*>(ns))
                        : xmlGetNoNsProp(node, xml_name);
    if (value == nullptr) {
        return std::nullopt;
    }
    std::string result(reinterpret_cast<const char*>(value));
    xmlFree(value);
    return result;
}

std::string node_text(const xmlNode* node) {
    xmlChar* content = xmlNodeGetContent(node);
    if (content == nullptr) {
        return "";
    }
    std::string result(reinterpret_cast<const char*>(content));
    xmlFree(content);
    return result;
}

// Concatenated <t> runs of a rich or plain string, skipping phonetic runs
void collect_text(const xmlNode* node, std::string& out) {
    for (const xmlNode* child = node->children; child; child = child->next) {
        if (child->type != XML_ELEMENT_NODE || is_element(child, "rPh")) {
            continue;
        }
        if (is_element(child, "t")) {
            out += node_text(child);
        } else {
            collect_text(child, out);
        }
    }
}

std::string resolve_part_path(const std::string& target) {
    if (!target.empty() && target.front() == '/') {
        return target.substr(1);
    }
    return "xl/" + target;
}

} // anonymous namespace

XlsxReader::XlsxReader(const std::string& filepath)
    : filepath_(filepath), archive_(open_archive(filepath)) {
    init_libxml();
    read_workbook();
    read_shared_strings();
}

bool XlsxReader::has_sheet(const std::string& name) const {
    return sheet_paths_.count(name) > 0;
}

void XlsxReader::read_workbook() {
    if (!archive_.contains(WORKBOOK_PART) || !archive_.contains(WORKBOOK_RELS_PART)) {
        throw TableLoadError(filepath_ + " is not an xlsx workbook");
    }

    std::map<std::string, std::string> targets;  // relationship id -> part path
    XmlDocPtr rels = parse_part(archive_, WORKBOOK_RELS_PART);
    for (const xmlNode* node = xmlDocGetRootElement(rels.get())->children; node; node = node->next) {
        if (!is_element(node, "Relationship")) continue;
        auto id = attribute(node, "Id");
        auto target = attribute(node, "Target");
        if (id && target) {
            targets[*id] = resolve_part_path(*target);
        }
    }

    XmlDocPtr workbook = parse_part(archive_, WORKBOOK_PART);
    const xmlNode* sheets = first_child(xmlDocGetRootElement(workbook.get()), "sheets");
    if (sheets == nullptr) {
        throw TableLoadError(filepath_ + ": workbook has no sheets");
    }

    for (const xmlNode* node = sheets->children; node; node = node->next) {
        if (!is_element(node, "sheet")) continue;

        auto name = attribute(node, "name");
        auto rel_id = attribute(node, "id", RELATIONSHIPS_NS);
        if (!name || !rel_id) {
            throw TableLoadError(filepath_ + ": sheet entry missing name or relationship id");
        }

        auto target = targets.find(*rel_id);
        if (target == targets.end()) {
            throw TableLoadError(filepath_ + ": no relationship " + *rel_id +
                                 " for sheet '" + *name + "'");
        }

        sheet_names_.push_back(*name);
        sheet_paths_[*name] = target->second;
    }
}

void XlsxReader::read_shared_strings() {
    if (!archive_.contains(SHARED_STRINGS_PART)) {
        return;  // workbooks without text cells omit the part
    }

    XmlDocPtr doc = parse_part(archive_, SHARED_STRINGS_PART);
    for (const xmlNode* node = xmlDocGetRootElement(doc.get())->children; node; node = node->next) {
        if (!is_element(node, "si")) continue;
        std::string text;
        collect_text(node, text);
        shared_strings_.push_back(std::move(text));
    }
}

SheetRows XlsxReader::read_sheet(const std::string& name) const {
    auto it = sheet_paths_.find(name);
    if (it == sheet_paths_.end()) {
        throw TableLoadError(filepath_ + ": no worksheet named '" + name + "'");
    }

    XmlDocPtr doc = parse_part(archive_, it->second);
    const xmlNode* sheet_data = first_child(xmlDocGetRootElement(doc.get()), "sheetData");

    SheetRows rows;
    if (sheet_data == nullptr) {
        return rows;
    }

    for (const xmlNode* row_node = sheet_data->children; row_node; row_node = row_node->next) {
        if (!is_element(row_node, "row")) continue;

        size_t row_index = rows.size();
        if (auto r = attribute(row_node, "r")) {
            size_t number = 0;
            if (!r->empty() && std::isdigit(static_cast<unsigned char>((*r)[0]))) {
                try {
                    number = row_number(*r);
                } catch (const TableLoadError& e) {
                    throw TableLoadError(filepath_ + ": " + e.what());
                }
            }
            if (number == 0) {
                throw TableLoadError(filepath_ + ": invalid row number '" + *r + "'");
            }
            if (number - 1 < rows.size()) {
                throw TableLoadError(filepath_ + ": rows out of order at row " + *r);
            }
            row_index = number - 1;
        }
        if (row_index >= MAX_ROWS) {
            throw TableLoadError(filepath_ + ": more than " + std::to_string(MAX_ROWS) + " rows");
        }
        rows.resize(row_index + 1);
        std::vector<std::string>& row = rows[row_index];

        for (const xmlNode* cell = row_node->children; cell; cell = cell->next) {
            if (!is_element(cell, "c")) continue;

            size_t column = row.size();
            if (auto ref = attribute(cell, "r")) {
                size_t ref_row = 0;
                try {
                    column = column_index(*ref);
                    ref_row = row_number(*ref);
                } catch (const TableLoadError& e) {
                    throw TableLoadError(filepath_ + ": " + e.what());
                }
                if (ref_row != 0 && ref_row != row_index + 1) {
                    throw TableLoadError(filepath_ + ": cell " + *ref + " is outside row " +
                                         std::to_string(row_index + 1));
                }
            }
            if (column >= MAX_COLUMNS) {
                throw TableLoadError(filepath_ + ": more than " + std::to_string(MAX_COLUMNS) +
                                     " columns in row " + std::to_string(row_index + 1));
            }

            std::string type = attribute(cell, "t").value_or("n");
            const xmlNode* value_node = first_child(cell, "v");
            std::string value;

            if (type == "inlineStr") {
                if (const xmlNode* is = first_child(cell, "is")) {
                    collect_text(is, value);
                }
            } else if (value_node != nullptr) {
                std::string raw = node_text(value_node);
                if (type == "s") {
                    size_t index = 0;
                    try {
                        index = std::stoul(raw);
                    } catch (const std::exception&) {
                        throw TableLoadError(filepath_ + ": invalid shared string index '" + raw + "'");
                    }
                    if (index >= shared_strings_.size()) {
                        throw TableLoadError(filepath_ + ": shared string index " + raw +
                                             " out of range");
                    }
                    value = shared_strings_[index];
                } else if (type == "b") {
                    value = (raw == "1") ? "TRUE" : "FALSE";
                } else {
                    value = raw;
                }
            }

            if (column >= row.size()) {
                row.resize(column + 1);
            }
            row[column] = std::move(value);
        }
    }

    return rows;
}

size_t XlsxReader::column_index(const std::string& cell_reference) {
    size_t column = 0;
    size_t letters = 0;

    for (char c : cell_reference) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (!std::isalpha(uc)) break;
        column = column * 26 + static_cast<size_t>(std::toupper(uc) - 'A' + 1);
        ++letters;
    }

    if (letters == 0 || letters > 3) {
        throw TableLoadError("Invalid cell reference '" + cell_reference + "'");
    }
    if (column > MAX_COLUMNS) {
        throw TableLoadError("Cell reference '" + cell_reference + "' is past column XFD");
    }
    return column - 1;
}

size_t XlsxReader::row_number(const std::string& cell_reference) {
    size_t pos = 0;
    while (pos < cell_reference.size() &&
           std::isalpha(static_cast<unsigned char>(cell_reference[pos]))) {
        ++pos;
    }

    size_t number = 0;
    for (; pos < cell_reference.size(); ++pos) {
        unsigned char c = static_cast<unsigned char>(cell_reference[pos]);
        if (!std::isdigit(c)) {
            return 0;
        }
        number = number * 10 + static_cast<size_t>(c - '0');
        if (number > MAX_ROWS) {
            throw TableLoadError("Cell reference '" + cell_reference + "' is past row " +
                                 std::to_string(MAX_ROWS));
        }
    }
    return number;
}

} // namespace io
} // namespace premium
