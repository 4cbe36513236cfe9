#include "cleansheet/xml/HiddenNodePruner.hpp"
#include "cleansheet/utils/Logger.hpp"
#include "support/ArchiveFixtures.hpp"
#include <gtest/gtest.h>
#include <string>

namespace cleansheet {
namespace xml {

class HiddenNodePrunerTest : public ::testing::Test {
protected:
    void SetUp() override {
        cleansheet::Logger::getInstance().initialize("logs/HiddenNodePruner_test.log",
                                                    cleansheet::Logger::Level::DEBUG,
                                                    false);
    }

    void TearDown() override {
        cleansheet::Logger::getInstance().shutdown();
    }

    static XMLDocument load(const std::string& xml) {
        auto parsed = XMLDocument::parse(xml);
        EXPECT_TRUE(parsed);
        return parsed ? std::move(parsed).value() : XMLDocument();
    }

    static std::vector<std::string> attributeValues(const XMLDocument& doc, const char* ns,
                                                    const char* element, const char* attr_ns,
                                                    const char* attr) {
        std::vector<std::string> values;
        for (NodeId id : doc.findElements(ns, element)) {
            const std::string* v = doc.attribute(id, attr_ns, attr);
            values.push_back(v ? *v : std::string());
        }
        return values;
    }
};

TEST_F(HiddenNodePrunerTest, RemovesHiddenAndVeryHiddenSheets) {
    XMLDocument doc = load(test_support::WORKBOOK_WITH_HIDDEN);
    HiddenNodePruner pruner(opc::FormatProfile::spreadsheetML());

    PruneResult result = pruner.prune(doc);

    EXPECT_EQ(result.removed, 2u);
    ASSERT_EQ(result.removed_labels.size(), 2u);
    EXPECT_EQ(result.removed_labels[0], "Hidden");
    EXPECT_EQ(result.removed_labels[1], "Secret");

    auto names = attributeValues(doc, opc::ns::SPREADSHEETML_MAIN, "sheet", "", "name");
    ASSERT_EQ(names.size(), 1u);
    EXPECT_EQ(names[0], "Visible");

    // 其余结构保持不变
    EXPECT_EQ(doc.findElements(opc::ns::SPREADSHEETML_MAIN, "bookViews").size(), 1u);
    EXPECT_EQ(doc.findElements(opc::ns::SPREADSHEETML_MAIN, "definedName").size(), 1u);
}

TEST_F(HiddenNodePrunerTest, RemovesOnlyTablesWithDisplayFalse) {
    XMLDocument doc = load(test_support::ODS_CONTENT_WITH_HIDDEN);
    HiddenNodePruner pruner(opc::FormatProfile::openDocument());

    PruneResult result = pruner.prune(doc);

    EXPECT_EQ(result.removed, 1u);
    ASSERT_EQ(result.removed_labels.size(), 1u);
    EXPECT_EQ(result.removed_labels[0], "Concealed");

    auto names = attributeValues(doc, opc::ns::ODF_TABLE, "table", opc::ns::ODF_TABLE, "name");
    ASSERT_EQ(names.size(), 2u);
    EXPECT_EQ(names[0], "Shown");
    EXPECT_EQ(names[1], "Explicit");
}

TEST_F(HiddenNodePrunerTest, NestedHiddenNodesCountOnce) {
    XMLDocument doc = load(
        R"(<office:document-content xmlns:office="urn:oasis:names:tc:opendocument:xmlns:office:1.0" )"
        R"(xmlns:table="urn:oasis:names:tc:opendocument:xmlns:table:1.0"><office:body>)"
        R"(<table:table table:name="Outer" table:display="false">)"
        R"(<table:table table:name="Inner" table:display="false"/>)"
        R"(</table:table>)"
        R"(<table:table table:name="Kept"/>)"
        R"(</office:body></office:document-content>)");
    HiddenNodePruner pruner(opc::FormatProfile::openDocument());

    PruneResult result = pruner.prune(doc);

    EXPECT_EQ(result.removed, 1u);
    ASSERT_EQ(result.removed_labels.size(), 1u);
    EXPECT_EQ(result.removed_labels[0], "Outer");
    EXPECT_EQ(doc.findElements(opc::ns::ODF_TABLE, "table").size(), 1u);
}

TEST_F(HiddenNodePrunerTest, AllVisibleLeavesDocumentUntouched) {
    XMLDocument doc = load(test_support::WORKBOOK_ALL_VISIBLE);
    auto before = doc.serialize();
    ASSERT_TRUE(before);

    PruneResult result = HiddenNodePruner(opc::FormatProfile::spreadsheetML()).prune(doc);

    EXPECT_EQ(result.removed, 0u);
    EXPECT_TRUE(result.removed_labels.empty());
    auto after = doc.serialize();
    ASSERT_TRUE(after);
    EXPECT_EQ(after.value(), before.value());
}

TEST_F(HiddenNodePrunerTest, SecondPassRemovesNothing) {
    XMLDocument doc = load(test_support::WORKBOOK_WITH_HIDDEN);
    HiddenNodePruner pruner(opc::FormatProfile::spreadsheetML());

    EXPECT_EQ(pruner.prune(doc).removed, 2u);
    auto first = doc.serialize();
    ASSERT_TRUE(first);

    XMLDocument reparsed = load(first.value());
    EXPECT_EQ(pruner.prune(reparsed).removed, 0u);
    auto second = reparsed.serialize();
    ASSERT_TRUE(second);
    EXPECT_EQ(second.value(), first.value());
}

TEST_F(HiddenNodePrunerTest, LabelFallsBackToTraversalIndex) {
    XMLDocument doc = load(
        R"(<workbook xmlns="http://schemas.openxmlformats.org/spreadsheetml/2006/main"><sheets>)"
        R"(<sheet name="First"/>)"
        R"(<sheet sheetId="7" state="hidden"/>)"
        R"(<sheet state="veryHidden"/>)"
        R"(</sheets></workbook>)");

    PruneResult result = HiddenNodePruner(opc::FormatProfile::spreadsheetML()).prune(doc);

    ASSERT_EQ(result.removed, 2u);
    EXPECT_EQ(result.removed_labels[0], "7");
    EXPECT_EQ(result.removed_labels[1], "#2");
}

TEST_F(HiddenNodePrunerTest, MatchesByNamespaceNotPrefix) {
    XMLDocument doc = load(
        R"(<x:workbook xmlns:x="http://schemas.openxmlformats.org/spreadsheetml/2006/main"><x:sheets>)"
        R"(<x:sheet name="A" sheetId="1"/><x:sheet name="B" sheetId="2" state="hidden"/>)"
        R"(</x:sheets><other:sheet xmlns:other="urn:example" name="C" state="hidden"/></x:workbook>)");

    PruneResult result = HiddenNodePruner(opc::FormatProfile::spreadsheetML()).prune(doc);

    ASSERT_EQ(result.removed, 1u);
    EXPECT_EQ(result.removed_labels[0], "B");
    EXPECT_EQ(doc.findElements("urn:example", "sheet").size(), 1u);
}

TEST_F(HiddenNodePrunerTest, HiddenValueComparisonIsExact) {
    XMLDocument doc = load(
        R"(<workbook xmlns="http://schemas.openxmlformats.org/spreadsheetml/2006/main"><sheets>)"
        R"(<sheet name="Upper" state="HIDDEN"/><sheet name="Lower" state="hidden"/>)"
        R"(</sheets></workbook>)");
    HiddenNodePruner pruner(opc::FormatProfile::spreadsheetML());

    auto sheets = doc.findElements(opc::ns::SPREADSHEETML_MAIN, "sheet");
    ASSERT_EQ(sheets.size(), 2u);
    EXPECT_FALSE(pruner.isHidden(doc, sheets[0]));
    EXPECT_TRUE(pruner.isHidden(doc, sheets[1]));
}

}} // namespace cleansheet::xml
