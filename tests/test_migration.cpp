#include <catch2/catch.hpp>
#include <revise/migration.hpp>

#include <stdexcept>

using namespace revise;

static SemanticVersion V(const std::string& s) {
    return SemanticVersion::parse(s).value();
}

// Step that records its own id into doc["applied"]
static MigrationScript step(const std::string& from, const std::string& to,
                            std::optional<double> duration = {},
                            bool reversible = false) {
    std::string id = from + "->" + to;
    RollbackFn rollback;
    if (reversible) {
        rollback = [](const Document& d) { return d; };
    }
    return make_migration(id, V(from), V(to), "test step",
        [id](const Document& d) {
            Document out = d;
            out["applied"].push_back(id);
            return out;
        },
        rollback, duration);
}

// ===== make_migration =====

TEST_CASE("make_migration wraps a transform into a successful step", "[migration]") {
    auto s = step("1.0.0", "1.1.0", 2.5, true);
    REQUIRE(s.id == "1.0.0->1.1.0");
    REQUIRE(s.reversible);
    REQUIRE(static_cast<bool>(s.rollback));
    REQUIRE(s.estimated_duration.value() == Approx(2.5));

    auto out = s.migrate(Document{{"name", "api"}});
    REQUIRE(out.success);
    REQUIRE(out.errors.empty());
    REQUIRE(out.migrated.has_value());
    REQUIRE((*out.migrated)["name"] == "api");
    REQUIRE((*out.migrated)["applied"][0] == "1.0.0->1.1.0");
}

TEST_CASE("make_migration turns a thrown error into a failed outcome", "[migration]") {
    auto s = make_migration("boom", V("1.0.0"), V("1.1.0"), "fails",
        [](const Document&) -> Document {
            throw std::runtime_error("field 'steps' missing");
        });
    REQUIRE_FALSE(s.reversible);

    auto out = s.migrate(Document::object());
    REQUIRE_FALSE(out.success);
    REQUIRE_FALSE(out.migrated.has_value());
    REQUIRE(out.errors == std::vector<std::string>{"field 'steps' missing"});
}

// ===== MigrationRegistry =====

TEST_CASE("migrations are kept sorted by source version", "[migration]") {
    MigrationRegistry reg;
    reg.add("api", step("1.2.0", "2.0.0"));
    reg.add("api", step("1.0.0", "1.1.0"));
    reg.add("api", step("1.1.0", "1.2.0"));

    const auto& list = reg.migrations("api");
    REQUIRE(list.size() == 3);
    REQUIRE(list[0].from_version.to_string() == "1.0.0");
    REQUIRE(list[1].from_version.to_string() == "1.1.0");
    REQUIRE(list[2].from_version.to_string() == "1.2.0");

    REQUIRE(reg.has("api"));
    REQUIRE_FALSE(reg.has("other"));
    REQUIRE(reg.migrations("other").empty());
}

TEST_CASE("equal source versions keep registration order", "[migration]") {
    MigrationRegistry reg;
    reg.add("api", step("1.0.0", "1.1.0"));
    reg.add("api", step("1.0.0", "1.0.5"));

    const auto& list = reg.migrations("api");
    REQUIRE(list[0].id == "1.0.0->1.1.0");
    REQUIRE(list[1].id == "1.0.0->1.0.5");
}

TEST_CASE("statistics summarise the registered steps", "[migration]") {
    MigrationRegistry reg;
    reg.add("api", step("1.0.0", "1.1.0", 4.0, true));
    reg.add("api", step("1.1.0", "2.0.0", 2.0));
    reg.add("api", step("2.0.0", "2.1.0"));

    auto stats = reg.statistics("api");
    REQUIRE(stats.total_migrations == 3);
    REQUIRE(stats.reversible_count == 1);
    REQUIRE(stats.average_duration == Approx(2.0));
    REQUIRE(stats.version_coverage.size() == 3);
    REQUIRE(stats.version_coverage[1].first == "1.1.0");
    REQUIRE(stats.version_coverage[1].second == "2.0.0");

    auto none = reg.statistics("other");
    REQUIRE(none.total_migrations == 0);
    REQUIRE(none.average_duration == 0.0);

    reg.clear();
    REQUIRE_FALSE(reg.has("api"));
}

// ===== MigrationPathfinder =====

TEST_CASE("finds a multi-step chain", "[migration][path]") {
    MigrationRegistry reg;
    reg.add("api", step("1.0.0", "1.1.0", 1.5, true));
    reg.add("api", step("1.1.0", "1.2.0", 2.0, true));
    reg.add("api", step("1.2.0", "2.0.0", 3.0, false));

    MigrationPathfinder finder(reg);
    auto path = finder.find("api", V("1.0.0"), V("2.0.0"));
    REQUIRE(path.has_value());
    REQUIRE(path->steps.size() == 3);
    REQUIRE(path->steps[0].id == "1.0.0->1.1.0");
    REQUIRE(path->steps[2].id == "1.2.0->2.0.0");
    REQUIRE(path->total_duration == Approx(6.5));
    REQUIRE_FALSE(path->reversible);
    REQUIRE(path->from.to_string() == "1.0.0");
    REQUIRE(path->to.to_string() == "2.0.0");

    auto partial = finder.find("api", V("1.1.0"), V("1.2.0"));
    REQUIRE(partial->steps.size() == 1);
    REQUIRE(partial->reversible);
}

TEST_CASE("missing link yields no path", "[migration][path]") {
    MigrationRegistry reg;
    reg.add("api", step("1.0.0", "1.1.0"));
    reg.add("api", step("1.1.0", "2.0.0"));

    MigrationPathfinder finder(reg);
    REQUIRE_FALSE(finder.find("api", V("2.0.0"), V("3.0.0")).has_value());
    REQUIRE_FALSE(finder.find("api", V("1.0.5"), V("2.0.0")).has_value());
    REQUIRE_FALSE(finder.can_migrate("api", V("2.0.0"), V("3.0.0")));
    REQUIRE(finder.can_migrate("api", V("1.0.0"), V("2.0.0")));
}

TEST_CASE("unknown template yields no path", "[migration][path]") {
    MigrationRegistry reg;
    MigrationPathfinder finder(reg);
    REQUIRE_FALSE(finder.find("api", V("1.0.0"), V("1.0.0")).has_value());
}

TEST_CASE("same source and target is an empty path", "[migration][path]") {
    MigrationRegistry reg;
    reg.add("api", step("1.0.0", "1.1.0"));

    auto path = MigrationPathfinder(reg).find("api", V("1.1.0"), V("1.1.0"));
    REQUIRE(path.has_value());
    REQUIRE(path->steps.empty());
    REQUIRE(path->reversible);
    REQUIRE(path->total_duration == 0.0);
}

TEST_CASE("overshooting the target yields no path", "[migration][path]") {
    MigrationRegistry reg;
    reg.add("api", step("1.0.0", "2.0.0"));

    REQUIRE_FALSE(MigrationPathfinder(reg).find("api", V("1.0.0"), V("1.5.0")).has_value());
}

TEST_CASE("cycles are detected", "[migration][path]") {
    MigrationRegistry reg;
    // Downgrade edges are rejected by validation but may still be registered
    reg.add("api", make_migration("up", V("1.0.0"), V("1.1.0"), "",
                                  [](const Document& d) { return d; }));
    reg.add("api", make_migration("down", V("1.1.0"), V("1.0.0"), "",
                                  [](const Document& d) { return d; }));

    REQUIRE_FALSE(MigrationPathfinder(reg).find("api", V("1.0.0"), V("2.0.0")).has_value());
}

TEST_CASE("first registered edge wins when a version branches", "[migration][path]") {
    MigrationRegistry reg;
    reg.add("api", step("1.0.0", "1.0.5"));
    reg.add("api", step("1.0.0", "1.1.0"));
    reg.add("api", step("1.0.5", "1.1.0"));

    auto path = MigrationPathfinder(reg).find("api", V("1.0.0"), V("1.1.0"));
    REQUIRE(path.has_value());
    REQUIRE(path->steps.size() == 2);
    REQUIRE(path->steps[0].id == "1.0.0->1.0.5");

    // Only the first edge from 1.0.0 is ever considered
    MigrationRegistry other;
    other.add("api", step("1.0.0", "2.0.0"));
    other.add("api", step("1.0.0", "1.1.0"));
    REQUIRE_FALSE(MigrationPathfinder(other).find("api", V("1.0.0"), V("1.1.0")).has_value());
}
