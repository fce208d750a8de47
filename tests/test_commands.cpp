#include "commands/add.hpp"
#include "commands/dump.hpp"
#include "commands/format.hpp"
#include "commands/validate.hpp"

#include "io/JsonIO.hpp"
#include "positions/ActivitiesFile.hpp"

#include <gtest/gtest.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace {

// argv for a command handler: argv[0] is the verb
class Args {
public:
    Args(std::initializer_list<std::string> args) : storage_(args) {
        for (auto& s : storage_) argv_.push_back(s.data());
    }
    int argc() const { return (int)argv_.size(); }
    char** argv() { return argv_.data(); }

private:
    std::vector<std::string> storage_;
    std::vector<char*> argv_;
};

class CommandsTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = fs::temp_directory_path() / ("positions_cmd_" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
        fs::remove_all(dir_);
        fs::create_directories(dir_);
        file_ = (dir_ / "activities.json").string();
        fs::copy_file(fs::path(POSITIONS_TEST_DATA_DIR) / "web_thing_api.json", file_);
        mock_ = std::string(POSITIONS_TEST_DATA_DIR) + "/http";
        unsetenv("GH_USER");
        unsetenv("GH_TOKEN");
    }

    void TearDown() override {
        unsetenv("GH_USER");
        unsetenv("GH_TOKEN");
        fs::remove_all(dir_);
    }

    fs::path dir_;
    std::string file_;
    std::string mock_;
};

}  // namespace

TEST_F(CommandsTest, ValidatePassesOnShippedActivities) {
    const std::string shipped = std::string(POSITIONS_SOURCE_DIR) + "/activities.json";
    Args a{"validate", "--file", shipped};
    testing::internal::CaptureStdout();
    const int rc = cmd_validate(a.argc(), a.argv());
    const std::string out = testing::internal::GetCapturedStdout();
    EXPECT_EQ(rc, 0);
    EXPECT_EQ(out, "VALIDATION: pass (1 entries)\n");
}

TEST_F(CommandsTest, ValidateFailsAndWritesReport) {
    {
        std::ofstream out(file_, std::ios::trunc);
        out << R"([{"title": "Bad", "description": "d", "org": "W3C", "url": "https://x.org/", "mozPosition": "maybe"}])";
    }
    const std::string report = (dir_ / "report.json").string();
    Args a{"validate", "--file", file_, "--report", report};
    testing::internal::CaptureStderr();
    const int rc = cmd_validate(a.argc(), a.argv());
    const std::string err = testing::internal::GetCapturedStderr();
    EXPECT_EQ(rc, 1);
    EXPECT_NE(err.find("* ERROR: Bad's mozPosition isn't one of"), std::string::npos);

    const auto j = positions::read_json_file(report);
    EXPECT_FALSE(j["pass"].get<bool>());
    ASSERT_EQ(j["errors"].size(), 1u);
    EXPECT_EQ(j["errors"][0]["code"].get<std::string>(), "bad_value");
    EXPECT_EQ(j["errors"][0]["entry"].get<std::string>(), "Bad");
}

TEST_F(CommandsTest, ValidateMissingFileFails) {
    Args a{"validate", "--file", (dir_ / "missing.json").string()};
    testing::internal::CaptureStderr();
    EXPECT_EQ(cmd_validate(a.argc(), a.argv()), 1);
    EXPECT_NE(testing::internal::GetCapturedStderr().find("Can't load"), std::string::npos);
}

TEST_F(CommandsTest, DumpReportsRecordFields) {
    Args a{"dump", "--file", file_, "--title", "web thing api"};
    testing::internal::CaptureStdout();
    const int rc = cmd_dump(a.argc(), a.argv());
    const std::string out = testing::internal::GetCapturedStdout();
    EXPECT_EQ(rc, 0);
    EXPECT_NE(out.find("[W3C] Web Thing API\n"), std::string::npos);
    EXPECT_NE(out.find("  mozPosition: participating\n"), std::string::npos);
    EXPECT_NE(out.find("  mozPositionIssue: 44\n"), std::string::npos);
    EXPECT_NE(out.find("  ciuName: null\n"), std::string::npos);
}

TEST_F(CommandsTest, DumpUnknownTitleFails) {
    Args a{"dump", "--file", file_, "--title", "Nope"};
    testing::internal::CaptureStderr();
    EXPECT_EQ(cmd_dump(a.argc(), a.argv()), 1);
    testing::internal::GetCapturedStderr();
}

TEST_F(CommandsTest, FormatPrintsNewEntry) {
    Args a{"format", "--http_mock", mock_, "https://www.w3.org/TR/wot-thing/"};
    testing::internal::CaptureStdout();
    testing::internal::CaptureStderr();
    const int rc = cmd_format(a.argc(), a.argv());
    const std::string out = testing::internal::GetCapturedStdout();
    const std::string err = testing::internal::GetCapturedStderr();
    ASSERT_EQ(rc, 0) << err;

    const auto j = nlohmann::json::parse(out);
    EXPECT_EQ(j["title"].get<std::string>(), "Web Thing API");
    EXPECT_EQ(j["url"].get<std::string>(), "https://w3c.github.io/wot-thing");
    EXPECT_EQ(j["mozPosition"].get<std::string>(), "under consideration");
    EXPECT_TRUE(j["mozPositionIssue"].is_null());
    EXPECT_NE(err.find("* Trying <https://w3c.github.io/wot-thing>..."), std::string::npos);
}

TEST_F(CommandsTest, FormatWithoutUrlShowsUsage) {
    Args a{"format"};
    testing::internal::CaptureStderr();
    EXPECT_EQ(cmd_format(a.argc(), a.argv()), 1);
    EXPECT_NE(testing::internal::GetCapturedStderr().find("usage:"), std::string::npos);
}

TEST_F(CommandsTest, AddRejectsDuplicate) {
    // the editor's draft has the same title as the shipped entry
    Args a{"add", "https://www.w3.org/TR/wot-thing/", "--file", file_, "--http_mock", mock_};
    testing::internal::CaptureStderr();
    const int rc = cmd_add(a.argc(), a.argv());
    const std::string err = testing::internal::GetCapturedStderr();
    EXPECT_EQ(rc, 1);
    EXPECT_NE(err.find("already contains Web Thing API"), std::string::npos);
    EXPECT_EQ(positions::ActivitiesFile::load(file_).size(), 1u);
}

TEST_F(CommandsTest, AddAppendsEntryWithIssueNumber) {
    positions::write_json_file(file_, nlohmann::json::array());
    setenv("GH_USER", "octocat", 1);
    setenv("GH_TOKEN", "secret", 1);

    Args a{"add", "https://www.w3.org/TR/wot-thing/", "--file", file_, "--http_mock", mock_};
    testing::internal::CaptureStderr();
    const int rc = cmd_add(a.argc(), a.argv());
    const std::string err = testing::internal::GetCapturedStderr();
    ASSERT_EQ(rc, 0) << err;
    EXPECT_NE(err.find("* Created Github Issue 57"), std::string::npos);

    const auto f = positions::ActivitiesFile::load(file_);
    EXPECT_TRUE(f.validate().pass);
    const auto records = f.records();
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].title, "Web Thing API");
    EXPECT_EQ(records[0].moz_position_issue.value_or(0), 57);
}

TEST_F(CommandsTest, AddWithoutIssue) {
    positions::write_json_file(file_, nlohmann::json::array());
    setenv("GH_USER", "octocat", 1);
    setenv("GH_TOKEN", "secret", 1);

    Args a{"add", "--no_issue", "--file", file_, "--http_mock", mock_, "https://www.w3.org/TR/wot-thing/"};
    testing::internal::CaptureStderr();
    const int rc = cmd_add(a.argc(), a.argv());
    const std::string err = testing::internal::GetCapturedStderr();
    ASSERT_EQ(rc, 0) << err;
    EXPECT_EQ(err.find("Created Github Issue"), std::string::npos);

    const auto records = positions::ActivitiesFile::load(file_).records();
    ASSERT_EQ(records.size(), 1u);
    EXPECT_FALSE(records[0].moz_position_issue.has_value());
}

namespace {

// fixture dir serving a single W3C page plus the issue endpoint
std::string write_mock(const fs::path& dir, const std::string& page_url, const std::string& html) {
    fs::create_directories(dir);
    {
        std::ofstream out(dir / "page.html", std::ios::binary);
        out << html;
    }
    nlohmann::json routes = {
        {page_url, {{"status", 200}, {"file", "page.html"}}},
        {"POST https://api.github.com/repos/mozilla/standards-positions/issues",
         {{"status", 201}, {"body", R"({"number": 99})"}}}
    };
    std::ofstream out(dir / "routes.json");
    out << routes.dump();
    return dir.string();
}

std::string slurp(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

}  // namespace

TEST_F(CommandsTest, AddRejectsInvalidEntryBeforeFilingIssue) {
    const std::string mock = write_mock(dir_ / "latin1", "https://w3c.github.io/cafe/",
        "<html><body><h1>Caf\xE9 API</h1>"
        "<section id=\"abstract\"><h2>Abstract</h2><p>Ordering coffee.</p></section></body></html>");
    setenv("GH_USER", "octocat", 1);
    setenv("GH_TOKEN", "secret", 1);
    const std::string before = slurp(file_);

    Args a{"add", "https://w3c.github.io/cafe/", "--file", file_, "--http_mock", mock};
    testing::internal::CaptureStderr();
    const int rc = cmd_add(a.argc(), a.argv());
    const std::string err = testing::internal::GetCapturedStderr();

    EXPECT_EQ(rc, 1);
    EXPECT_NE(err.find("isn't valid UTF-8"), std::string::npos) << err;
    EXPECT_EQ(err.find("Created Github Issue"), std::string::npos);
    EXPECT_EQ(slurp(file_), before);
}

TEST_F(CommandsTest, AddUsesHrefWhenLinkTextIsProse) {
    const std::string mock = write_mock(dir_ / "prose", "https://w3c.github.io/thing/",
        "<html><body><h1>Thing API</h1><dl>"
        "<dt>This version:</dt><dd><a href=\"https://w3c.github.io/thing/\">current draft</a></dd></dl>"
        "<section id=\"abstract\"><p>Things on the web.</p></section></body></html>");
    setenv("GH_USER", "octocat", 1);
    setenv("GH_TOKEN", "secret", 1);

    Args a{"add", "https://w3c.github.io/thing/", "--file", file_, "--http_mock", mock};
    testing::internal::CaptureStderr();
    const int rc = cmd_add(a.argc(), a.argv());
    const std::string err = testing::internal::GetCapturedStderr();
    ASSERT_EQ(rc, 0) << err;
    EXPECT_NE(err.find("* Created Github Issue 99"), std::string::npos);

    const auto records = positions::ActivitiesFile::load(file_).records();
    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[1].url, "https://w3c.github.io/thing");
    EXPECT_EQ(records[1].moz_position_issue.value_or(0), 99);
}
