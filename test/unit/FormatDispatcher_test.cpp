#include "cleansheet/core/FormatDispatcher.hpp"
#include "cleansheet/utils/Logger.hpp"
#include "support/ArchiveFixtures.hpp"
#include <gtest/gtest.h>
#include <filesystem>
#include <string>

namespace cleansheet {
namespace core {

class FormatDispatcherTest : public ::testing::Test {
protected:
    void SetUp() override {
        cleansheet::Logger::getInstance().initialize("logs/FormatDispatcher_test.log",
                                                    cleansheet::Logger::Level::DEBUG,
                                                    false);
        test_dir_ = "test_format_dispatcher";
        std::filesystem::create_directories(test_dir_);
    }

    void TearDown() override {
        std::filesystem::remove_all(test_dir_);
        cleansheet::Logger::getInstance().shutdown();
    }

    Path file(const std::string& name) const {
        return Path(test_dir_ + "/" + name);
    }

    std::string test_dir_;
    SanitizeOptions options_;
    DiagnosticLog diagnostics_;
};

TEST_F(FormatDispatcherTest, ClassifiesByExtension) {
    EXPECT_EQ(opc::classify(Path("book.xlsx")), opc::FileFamily::SpreadsheetML);
    EXPECT_EQ(opc::classify(Path("book.xlsm")), opc::FileFamily::SpreadsheetML);
    EXPECT_EQ(opc::classify(Path("dir/BOOK.XLSX")), opc::FileFamily::SpreadsheetML);
    EXPECT_EQ(opc::classify(Path("calc.ods")), opc::FileFamily::OpenDocument);
    EXPECT_EQ(opc::classify(Path("table.CSV")), opc::FileFamily::Tabular);
    EXPECT_EQ(opc::classify(Path("legacy.xls")), opc::FileFamily::Unsupported);
    EXPECT_EQ(opc::classify(Path("notes.txt")), opc::FileFamily::Unsupported);
    EXPECT_EQ(opc::classify(Path("no_extension")), opc::FileFamily::Unsupported);
    EXPECT_EQ(opc::classify(Path("archive.xlsx.bak")), opc::FileFamily::Unsupported);
}

TEST_F(FormatDispatcherTest, UnsupportedTypeTouchesNothing) {
    Path input = file("notes.txt");
    Path output = file("out.txt");
    ASSERT_TRUE(input.writeAll("plain text"));

    FormatDispatcher dispatcher(options_, diagnostics_);
    VoidResult result = dispatcher.dispatch(input, output);

    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, ErrorCode::UnsupportedType);
    EXPECT_NE(result.error().message.find("notes.txt"), std::string::npos);
    EXPECT_FALSE(output.exists());
}

TEST_F(FormatDispatcherTest, UnsupportedTypeMapsToFailureSignal) {
    FormatDispatcher dispatcher(options_, diagnostics_);

    ExitSignal signal = dispatcher.run(file("legacy.xls"), file("out.xls"));

    EXPECT_EQ(signal, ExitSignal::Failure);
    EXPECT_EQ(toExitCode(signal), 1);
    EXPECT_TRUE(diagnostics_.hasErrors());
    EXPECT_EQ(diagnostics_.count(ErrorCode::UnsupportedType), 1u);
}

TEST_F(FormatDispatcherTest, OpenDocumentMacroRemovalWarnsAndContinues) {
    Path input = file("calc.ods");
    Path output = file("clean.ods");
    ASSERT_TRUE(test_support::writeArchive(input.string(), test_support::sampleOdsEntries()));

    options_.remove_macros = true;
    FormatDispatcher dispatcher(options_, diagnostics_);
    ExitSignal signal = dispatcher.run(input, output);

    EXPECT_EQ(signal, ExitSignal::Success);
    EXPECT_EQ(diagnostics_.count(ErrorCode::CapabilityUnsupported), 1u);
    EXPECT_FALSE(diagnostics_.hasErrors());
    EXPECT_EQ(dispatcher.report().family, opc::FileFamily::OpenDocument);
    EXPECT_EQ(dispatcher.report().archive.total_entries, 4u);
    EXPECT_EQ(dispatcher.report().archive.dropped, 0u);
    EXPECT_EQ(test_support::readArchive(output.string()), test_support::sampleOdsEntries());
}

TEST_F(FormatDispatcherTest, RoutesWorkbookThroughTranscoder) {
    Path input = file("book.xlsm");
    Path output = file("clean.xlsm");
    ASSERT_TRUE(test_support::writeArchive(input.string(), test_support::sampleWorkbookEntries()));

    options_.remove_macros = true;
    FormatDispatcher dispatcher(options_, diagnostics_);
    ASSERT_EQ(dispatcher.run(input, output), ExitSignal::Success);

    EXPECT_EQ(dispatcher.report().family, opc::FileFamily::SpreadsheetML);
    EXPECT_EQ(dispatcher.report().archive.dropped, 1u);
    EXPECT_EQ(dispatcher.report().archive.copied, 5u);
    EXPECT_FALSE(test_support::hasEntry(test_support::readArchive(output.string()), "xl/vbaProject.bin"));
}

TEST_F(FormatDispatcherTest, RoutesCsvThroughRowFilter) {
    Path input = file("data.csv");
    Path output = file("clean.csv");
    ASSERT_TRUE(input.writeAll("a,b\n1,2\n3,\n"));

    FormatDispatcher dispatcher(options_, diagnostics_);
    ASSERT_EQ(dispatcher.run(input, output), ExitSignal::Success);

    EXPECT_EQ(dispatcher.report().family, opc::FileFamily::Tabular);
    EXPECT_EQ(dispatcher.report().csv.rows_dropped, 1u);
    EXPECT_EQ(test_support::readFile(output.string()), "a,b\n1,2\n");
}

TEST_F(FormatDispatcherTest, MissingInputFails) {
    FormatDispatcher dispatcher(options_, diagnostics_);
    VoidResult result = dispatcher.dispatch(file("absent.xlsx"), file("out.xlsx"));

    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, ErrorCode::NotFound);
    EXPECT_FALSE(file("out.xlsx").exists());
}

}} // namespace cleansheet::core
