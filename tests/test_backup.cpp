#include <catch2/catch.hpp>
#include <revise/backup.hpp>

#include <filesystem>
#include <fstream>
#include <regex>
#include <sstream>

using namespace revise;

namespace fs = std::filesystem;

static std::string temp_dir(const std::string& name) {
    fs::path dir = fs::temp_directory_path() / ("revise_test_backup_" + name);
    fs::remove_all(dir);
    return dir.string();
}

TEST_CASE("backup timestamp has no colons or dots", "[backup]") {
    auto ts = backup_timestamp();
    REQUIRE(std::regex_match(ts,
        std::regex(R"(\d{4}-\d{2}-\d{2}T\d{2}-\d{2}-\d{2}-\d{3}Z)")));
}

TEST_CASE("write_backup names the file after the template and creates the directory", "[backup]") {
    auto dir = temp_dir("naming");
    std::string nested = dir + "/a/b";

    Document doc = {{"name", "api"}, {"steps", {1, 2, 3}}};
    auto r = write_backup("api-design", doc, nested);
    REQUIRE(r.is_ok());

    fs::path written(r.value());
    REQUIRE(fs::exists(written));
    REQUIRE(written.parent_path() == fs::path(nested));
    REQUIRE(std::regex_match(written.filename().string(),
        std::regex(R"(api-design_\d{4}-\d{2}-\d{2}T\d{2}-\d{2}-\d{2}-\d{3}Z_backup\.json)")));

    std::ifstream in(written);
    std::ostringstream ss;
    ss << in.rdbuf();
    REQUIRE(ss.str() == "{\n  \"name\": \"api\",\n  \"steps\": [\n    1,\n    2,\n    3\n  ]\n}");

    fs::remove_all(dir);
}

TEST_CASE("read_backup returns what write_backup wrote", "[backup]") {
    auto dir = temp_dir("read");
    Document doc = {{"zeta", 1}, {"alpha", {{"nested", nullptr}}}, {"list", Document::array()}};

    auto path = write_backup("t", doc, dir);
    REQUIRE(path.is_ok());

    auto back = read_backup(path.value());
    REQUIRE(back.is_ok());
    REQUIRE(back.value() == doc);
    // Key order survives the round trip
    REQUIRE(back.value().begin().key() == "zeta");

    fs::remove_all(dir);
}

TEST_CASE("read_backup enforces the size limit", "[backup]") {
    auto dir = temp_dir("limit");
    auto path = write_backup("t", Document{{"payload", std::string(64, 'x')}}, dir);
    REQUIRE(path.is_ok());

    REQUIRE(read_backup(path.value(), 1024).is_ok());

    auto r = read_backup(path.value(), 16);
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == ReviseError::Rollback);

    fs::remove_all(dir);
}

TEST_CASE("read_backup rejects empty and malformed files", "[backup]") {
    auto dir = temp_dir("malformed");
    fs::create_directories(dir);

    std::string empty = dir + "/empty.json";
    std::ofstream(empty).close();
    auto e = read_backup(empty);
    REQUIRE(e.is_err());
    REQUIRE(e.error().code == ReviseError::Rollback);
    REQUIRE(e.error().file == empty);

    std::string trailing = dir + "/trailing.json";
    std::ofstream(trailing) << "{} {}";
    REQUIRE(read_backup(trailing).is_err());

    fs::remove_all(dir);
}

TEST_CASE("read_backup reports out-of-range numbers as a rollback error", "[backup]") {
    auto dir = temp_dir("overflow");
    fs::create_directories(dir);

    std::string path = dir + "/overflow_backup.json";
    std::ofstream(path) << "{\"limit\": 1e999}";
    auto r = read_backup(path);
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == ReviseError::Rollback);
    REQUIRE(r.error().message.rfind("Rollback failed", 0) == 0);

    fs::remove_all(dir);
}

TEST_CASE("write_backup refuses invalid UTF-8 without leaving a file", "[backup]") {
    auto dir = temp_dir("utf8");
    auto r = write_backup("t", Document{{"name", "\xff\xfe"}}, dir);
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == ReviseError::IO);
    REQUIRE_FALSE(fs::exists(dir));
}

TEST_CASE("write_backup rejects ids that would leave the directory", "[backup]") {
    auto dir = temp_dir("ids");
    for (const char* id : {"", "a/b", "..", "..\\x", "x..y"}) {
        auto r = write_backup(id, Document::object(), dir);
        INFO(id);
        REQUIRE(r.is_err());
        REQUIRE(r.error().code == ReviseError::InvalidArg);
    }
    REQUIRE_FALSE(fs::exists(dir));
}
