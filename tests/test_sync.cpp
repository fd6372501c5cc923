#include <catch2/catch.hpp>
#include "sync.hpp"
#include "mock_crontab.hpp"
#include "runner_script.hpp"
#include <filesystem>
#include <fstream>
#include <sstream>
#include <unistd.h>

using namespace cronrepo;

static std::string make_temp_dir() {
    auto path = std::filesystem::temp_directory_path() / "cronrepo_test_XXXXXX";
    std::string tmpl = path.string();
    char* result = mkdtemp(tmpl.data());
    return result ? std::string(result) : "";
}

static std::string read_file(const std::string& path) {
    std::ifstream f(path);
    std::ostringstream ss;
    ss << f.rdbuf();
    return ss.str();
}

struct SyncFixture {
    std::string dir = make_temp_dir();
    MockCrontab crontab;
    CrontabSynchronizer sync{crontab, options()};

    SyncOptions options() const {
        SyncOptions o;
        o.dir = dir;
        o.host = "box";
        o.workdir = "/work";
        o.trampoline = "/opt/bin/cronrepo-run";
        o.env = {{"HOME", "/home/me"}, {"SSH_TTY", "/dev/pts/0"}};
        o.skipped_env = {"SSH_*"};
        return o;
    }

    std::vector<Tag> parse(const std::string& file, const std::string& content) const {
        auto r = TaglineParser::parse(content, dir + "/" + file);
        REQUIRE(r.errors.empty());
        return r.tags;
    }

    ~SyncFixture() { std::filesystem::remove_all(dir); }
};

// ── Rendering ────────────────────────────────────────────────────

TEST_CASE("CrontabSynchronizer: entry line uses canonical fields and the runner", "[sync]") {
    SyncFixture f;
    auto tags = f.parse("foo", "# CRON@t1::02 18 * * 1-5\n");
    REQUIRE(f.sync.entry_for(tags[0]) ==
            "2 18 * * 1-5 " + f.dir + "/.cronrepo-box-t1.sh " + f.dir + "/foo");
}

TEST_CASE("CrontabSynchronizer: job ID is exported inline and args appended", "[sync]") {
    SyncFixture f;
    auto tags = f.parse("foo", "# CRON@t1%daily:2:0 1 * * * + --mode fast\n");
    REQUIRE(f.sync.command_for(tags[0]) ==
            "CRONREPO_JID=daily " + f.dir + "/.cronrepo-box-t1.sh " + f.dir +
            "/foo --mode fast");
}

TEST_CASE("CrontabSynchronizer: percent signs are escaped for cron", "[sync]") {
    SyncFixture f;
    auto tags = f.parse("foo", "# CRON@t1::0 1 * * * + date=%Y\n");
    REQUIRE(f.sync.command_for(tags[0]).find("date=%Y") != std::string::npos);
    REQUIRE(f.sync.entry_for(tags[0]).find("date=\\%Y") != std::string::npos);
}

TEST_CASE("CrontabSynchronizer: block groups entries by frequency", "[sync]") {
    SyncFixture f;
    auto tags = f.parse("bar",
        "# CRON@t3::02 18 1 * *\n"
        "# CRON@t3::02 18 * * 6\n"
        "# CRON@t3::02 * * * 1-5\n"
        "# CRON@t3::00 09 * * 1-5\n"
        "# CRON@other::00 09 * * 1-5\n");
    std::string runner = f.dir + "/.cronrepo-box-t3.sh";
    std::string job = f.dir + "/bar";
    REQUIRE(f.sync.generate(tags, "t3") ==
            "# BEGIN cronrepo generated: t3\n"
            "# Source directory: " + f.dir + "\n"
            "# More frequent than daily\n"
            "2 * * * 1-5 " + runner + " " + job + "\n"
            "# Weekends\n"
            "2 18 * * 6 " + runner + " " + job + "\n"
            "# Monthly\n"
            "2 18 1 * * " + runner + " " + job + "\n"
            "# Weekdays\n"
            "0 9 * * 1-5 " + runner + " " + job + "\n"
            "# END cronrepo generated: t3\n");
}

TEST_CASE("CrontabSynchronizer: unknown target renders an empty block", "[sync]") {
    SyncFixture f;
    auto tags = f.parse("foo", "# CRON@t1::02 18 * * 1-5\n");
    REQUIRE(f.sync.generate(tags, "t") ==
            "# BEGIN cronrepo generated: t\n"
            "# Source directory: " + f.dir + "\n"
            "# END cronrepo generated: t\n");
}

TEST_CASE("CrontabSynchronizer: generate without target covers every target", "[sync]") {
    SyncFixture f;
    auto tags = f.parse("foo", "# CRON@b::0 1 * * *\n# CRON@a::0 2 * * *\n");
    auto out = f.sync.generate(tags, "");
    auto a = out.find("# BEGIN cronrepo generated: a");
    auto b = out.find("# BEGIN cronrepo generated: b");
    REQUIRE(a != std::string::npos);
    REQUIRE(b != std::string::npos);
    REQUIRE(a < b);
    REQUIRE(f.crontab.read_count == 0);
}

// ── install ──────────────────────────────────────────────────────

TEST_CASE("CrontabSynchronizer: install appends the block and writes the runner", "[sync]") {
    SyncFixture f;
    f.crontab.content = "MAILTO=me\n# hello\n";
    auto tags = f.parse("foo", "# CRON@t1::02 18 * * 1-5\n");

    REQUIRE(f.sync.install(tags, "t1"));
    REQUIRE(f.crontab.content == "MAILTO=me\n# hello\n" + f.sync.generate(tags, "t1"));

    auto script = read_file(f.dir + "/.cronrepo-box-t1.sh");
    REQUIRE(script.find("export HOME=/home/me\n") != std::string::npos);
    REQUIRE(script.find("SSH_TTY") == std::string::npos);
    REQUIRE(script.find("\ncd /work\n") != std::string::npos);
    REQUIRE(script.find("\nexec /opt/bin/cronrepo-run \"$@\"\n") != std::string::npos);
}

TEST_CASE("CrontabSynchronizer: installing twice is a no-op", "[sync]") {
    SyncFixture f;
    f.crontab.content = "# hello\n";
    auto tags = f.parse("foo", "# CRON@t1::02 18 * * 1-5\n");

    REQUIRE(f.sync.install(tags, "t1"));
    std::string first = f.crontab.content;
    REQUIRE_FALSE(f.sync.install(tags, "t1"));
    REQUIRE(f.crontab.content == first);
    REQUIRE(f.crontab.write_count == 1);
}

TEST_CASE("CrontabSynchronizer: reinstall replaces the block in place", "[sync]") {
    SyncFixture f;
    f.crontab.content = "# head\n";
    REQUIRE(f.sync.install(f.parse("foo", "# CRON@t1::0 1 * * *\n"), "t1"));
    f.crontab.content += "# tail\n";

    auto tags = f.parse("foo", "# CRON@t1::0 2 * * *\n");
    REQUIRE(f.sync.install(tags, "t1"));
    REQUIRE(f.crontab.content == "# head\n" + f.sync.generate(tags, "t1") + "# tail\n");
}

TEST_CASE("CrontabSynchronizer: other targets' blocks survive an install", "[sync]") {
    SyncFixture f;
    auto tags = f.parse("foo", "# CRON@t1::0 1 * * *\n# CRON@t2::0 2 * * *\n");
    REQUIRE(f.sync.install(tags, "t2"));
    REQUIRE(f.sync.install(tags, "t1"));
    REQUIRE(f.crontab.content == f.sync.generate(tags, "t2") + f.sync.generate(tags, "t1"));
}

TEST_CASE("CrontabSynchronizer: install without target installs each target", "[sync]") {
    SyncFixture f;
    auto tags = f.parse("foo", "# CRON@t1::0 1 * * *\n# CRON@t2::0 2 * * *\n");
    REQUIRE(f.sync.install(tags, ""));
    REQUIRE(f.crontab.write_count == 1);
    REQUIRE(std::filesystem::exists(f.dir + "/.cronrepo-box-t1.sh"));
    REQUIRE(std::filesystem::exists(f.dir + "/.cronrepo-box-t2.sh"));
    REQUIRE(f.sync.installed_targets() == std::vector<std::string>{"t1", "t2"});
}

TEST_CASE("CrontabSynchronizer: full install retires targets without taglines", "[sync]") {
    SyncFixture f;
    f.crontab.content = "# hello\n";
    REQUIRE(f.sync.install(f.parse("foo", "# CRON@t1::0 1 * * *\n# CRON@t2::0 2 * * *\n"), ""));
    REQUIRE(std::filesystem::exists(f.dir + "/.cronrepo-box-t1.sh"));

    // The t1 tagline was deleted from the directory
    auto tags = f.parse("foo", "# CRON@t2::0 2 * * *\n");
    REQUIRE(f.sync.install(tags, ""));
    REQUIRE(f.crontab.content == "# hello\n" + f.sync.generate(tags, "t2"));
    REQUIRE_FALSE(std::filesystem::exists(f.dir + "/.cronrepo-box-t1.sh"));
    REQUIRE(std::filesystem::exists(f.dir + "/.cronrepo-box-t2.sh"));
    REQUIRE(f.sync.installed_targets() == std::vector<std::string>{"t2"});

    REQUIRE_FALSE(f.sync.install(tags, ""));
}

TEST_CASE("CrontabSynchronizer: full install with no taglines left clears the directory's blocks", "[sync]") {
    SyncFixture f;
    f.crontab.content = "# hello\n";
    REQUIRE(f.sync.install(f.parse("foo", "# CRON@t1::0 1 * * *\n"), ""));

    REQUIRE(f.sync.install({}, ""));
    REQUIRE(f.crontab.content == "# hello\n");
    REQUIRE_FALSE(std::filesystem::exists(f.dir + "/.cronrepo-box-t1.sh"));
}

TEST_CASE("CrontabSynchronizer: targeted install leaves other targets alone", "[sync]") {
    SyncFixture f;
    REQUIRE(f.sync.install(f.parse("foo", "# CRON@t1::0 1 * * *\n# CRON@t2::0 2 * * *\n"), ""));

    auto tags = f.parse("foo", "# CRON@t2::0 3 * * *\n");
    REQUIRE(f.sync.install(tags, "t2"));
    REQUIRE(f.crontab.content.find("# BEGIN cronrepo generated: t1\n") != std::string::npos);
    REQUIRE(std::filesystem::exists(f.dir + "/.cronrepo-box-t1.sh"));
}

TEST_CASE("CrontabSynchronizer: blocks of other directories survive a full install", "[sync]") {
    SyncFixture f;
    std::string foreign = markers_for("t9").begin + "\n" + source_header("/elsewhere") +
                          "\n0 0 * * * x\n" + markers_for("t9").end + "\n";
    f.crontab.content = foreign;
    auto tags = f.parse("foo", "# CRON@t1::0 1 * * *\n");
    REQUIRE(f.sync.install(tags, ""));
    REQUIRE(f.crontab.content == foreign + f.sync.generate(tags, "t1"));
}

TEST_CASE("CrontabSynchronizer: crontab failures surface as SyncError", "[sync]") {
    SyncFixture f;
    auto tags = f.parse("foo", "# CRON@t1::0 1 * * *\n");
    f.crontab.fail_read = true;
    REQUIRE_THROWS_AS(f.sync.install(tags, "t1"), SyncError);
    REQUIRE(f.crontab.write_count == 0);

    f.crontab.fail_read = false;
    f.crontab.fail_write = true;
    f.crontab.content = "# keep\n";
    REQUIRE_THROWS_AS(f.sync.install(tags, "t1"), SyncError);
    REQUIRE(f.crontab.content == "# keep\n");
}

// ── uninstall ────────────────────────────────────────────────────

TEST_CASE("CrontabSynchronizer: uninstall removes block and runner", "[sync]") {
    SyncFixture f;
    f.crontab.content = "# hello\n";
    auto tags = f.parse("foo", "# CRON@t1::0 1 * * *\n");
    REQUIRE(f.sync.install(tags, "t1"));

    REQUIRE(f.sync.uninstall({"t1"}));
    REQUIRE(f.crontab.content == "# hello\n");
    REQUIRE_FALSE(std::filesystem::exists(f.dir + "/.cronrepo-box-t1.sh"));
}

TEST_CASE("CrontabSynchronizer: uninstall of a never-installed target is a no-op", "[sync]") {
    SyncFixture f;
    f.crontab.content = "# hello";
    REQUIRE_FALSE(f.sync.uninstall({"t1"}));
    REQUIRE(f.crontab.content == "# hello");
    REQUIRE(f.crontab.write_count == 0);
}

TEST_CASE("CrontabSynchronizer: uninstall then install reproduces install", "[sync]") {
    SyncFixture f;
    f.crontab.content = "# hello\n";
    auto tags = f.parse("foo", "# CRON@t1::0 1 * * *\n");
    REQUIRE(f.sync.install(tags, "t1"));
    std::string installed = f.crontab.content;

    REQUIRE(f.sync.uninstall({"t1"}));
    REQUIRE(f.sync.install(tags, "t1"));
    REQUIRE(f.crontab.content == installed);
}

TEST_CASE("targets_of: distinct and sorted", "[sync]") {
    auto r = TaglineParser::parse("# CRON@b::0 0 * * *\n# CRON@a::0 0 * * *\n# CRON@b::0 1 * * *\n", "f");
    REQUIRE(targets_of(r.tags) == std::vector<std::string>{"a", "b"});
}
