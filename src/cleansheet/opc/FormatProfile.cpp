#include "cleansheet/opc/FormatProfile.hpp"

namespace cleansheet {
namespace opc {

const char* toString(FileFamily family) noexcept {
    switch (family) {
        case FileFamily::SpreadsheetML: return "SpreadsheetML";
        case FileFamily::OpenDocument:  return "OpenDocument";
        case FileFamily::Tabular:       return "CSV";
        case FileFamily::Unsupported:   return "Unsupported";
    }
    return "Unknown";
}

FileFamily classify(const core::Path& path) {
    const std::string ext = path.extension();
    if (ext == "xlsx" || ext == "xlsm") {
        return FileFamily::SpreadsheetML;
    }
    if (ext == "ods") {
        return FileFamily::OpenDocument;
    }
    if (ext == "csv") {
        return FileFamily::Tabular;
    }
    return FileFamily::Unsupported;
}

const FormatProfile& FormatProfile::spreadsheetML() {
    static const FormatProfile profile = [] {
        FormatProfile p;
        p.family = FileFamily::SpreadsheetML;
        p.trigger_entry_name = "xl/workbook.xml";
        p.macro_entry_name = "xl/vbaProject.bin";
        p.element_namespace = ns::SPREADSHEETML_MAIN;
        p.element_local_name = "sheet";
        p.hidden_attribute_name = "state";
        p.hidden_attribute_values = {"hidden", "veryHidden"};
        p.hidden_attribute_default = "visible";
        p.identity_attributes = {{"", "name"}, {"", "sheetId"}};
        return p;
    }();
    return profile;
}

const FormatProfile& FormatProfile::openDocument() {
    static const FormatProfile profile = [] {
        FormatProfile p;
        p.family = FileFamily::OpenDocument;
        p.trigger_entry_name = "content.xml";
        p.element_namespace = ns::ODF_TABLE;
        p.element_local_name = "table";
        p.hidden_attribute_namespace = ns::ODF_TABLE;
        p.hidden_attribute_name = "display";
        p.hidden_attribute_values = {"false"};
        p.hidden_attribute_default = "true";
        p.identity_attributes = {{ns::ODF_TABLE, "name"}};
        return p;
    }();
    return profile;
}

}} // namespace cleansheet::opc
