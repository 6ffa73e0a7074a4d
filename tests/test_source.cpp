#include <catch2/catch.hpp>
#include <stow/source.hpp>

using namespace stow;

// ===== Dependency validation =====

TEST_CASE("path dependency is valid", "[source]") {
    Dependency d;
    d.name = "base";
    d.path = "../base";
    REQUIRE(d.validate().is_ok());
}

TEST_CASE("git dependency with ref and subpath is valid", "[source]") {
    Dependency d;
    d.name = "review";
    d.git = "https://github.com/acme/bundles.git";
    d.ref = "v1";
    d.subpath = "review";
    REQUIRE(d.validate().is_ok());
}

TEST_CASE("dependency without a source is rejected", "[source]") {
    Dependency d;
    d.name = "lonely";
    auto s = d.validate();
    REQUIRE(s.is_err());
    REQUIRE(s.error().code == StowError::Manifest);
}

TEST_CASE("dependency with two sources is rejected", "[source]") {
    Dependency d;
    d.name = "both";
    d.path = "./x";
    d.git = "https://example.com/x.git";
    REQUIRE(d.validate().error().code == StowError::Manifest);
}

TEST_CASE("ref on a path dependency is rejected", "[source]") {
    Dependency d;
    d.name = "x";
    d.path = "./x";
    d.ref = "main";
    REQUIRE(d.validate().is_err());
}

TEST_CASE("empty dependency name is rejected", "[source]") {
    Dependency d;
    d.path = "./x";
    REQUIRE(d.validate().is_err());
}

// ===== Identity =====

TEST_CASE("identity distinguishes ref and subpath, fetch identity does not", "[source]") {
    auto a = BundleSource::remote("https://example.com/r.git", "v1", "one");
    auto b = BundleSource::remote("https://example.com/r.git", "v2", "two");
    REQUIRE(a.identity() == "git+https://example.com/r.git#one@v1");
    REQUIRE(a.identity() != b.identity());
    REQUIRE(a.fetch_identity() == b.fetch_identity());
    REQUIRE(a.fetch_identity() == "git+https://example.com/r.git");
    REQUIRE(a != b);

    auto d = BundleSource::directory("/srv/bundles/base");
    REQUIRE(d.identity() == "dir+/srv/bundles/base");
    REQUIRE(d.fetch_identity() == d.identity());
    REQUIRE(d.ref().empty());
}

TEST_CASE("revision does not change identity", "[source]") {
    auto a = BundleSource::remote("https://example.com/r.git", "main", "", "abc");
    auto b = BundleSource::remote("https://example.com/r.git", "main", "", "def");
    REQUIRE(a == b);
}

TEST_CASE("display shows ref and subpath", "[source]") {
    REQUIRE(BundleSource::remote("https://x/r.git", "v1", "sub").display() == "https://x/r.git#v1:sub");
    REQUIRE(BundleSource::remote("https://x/r.git", "", "").display() == "https://x/r.git");
    REQUIRE(BundleSource::directory("/a/b").display() == "/a/b");
}

// ===== Source specs =====

TEST_CASE("directory specs", "[source]") {
    for (const char* spec : {"./bundle", "../bundle", "/abs/bundle", ".", ".."}) {
        auto r = parse_source_spec(spec);
        REQUIRE(r.is_ok());
        REQUIRE(r.value().is_directory());
        REQUIRE(r.value().dir().path == spec);
    }
}

TEST_CASE("github shorthand specs", "[source]") {
    auto a = parse_source_spec("github:acme/bundles");
    REQUIRE(a.is_ok());
    REQUIRE(a.value().is_remote());
    REQUIRE(a.value().remote().origin == "https://github.com/acme/bundles.git");
    REQUIRE(a.value().remote().ref.empty());

    auto b = parse_source_spec("acme/bundles#v2");
    REQUIRE(b.value().remote().origin == "https://github.com/acme/bundles.git");
    REQUIRE(b.value().remote().ref == "v2");
}

TEST_CASE("ref and subpath fragments", "[source]") {
    auto a = parse_source_spec("https://example.com/r.git#main:bundles/review/");
    REQUIRE(a.is_ok());
    REQUIRE(a.value().remote().ref == "main");
    REQUIRE(a.value().remote().subpath == "bundles/review");

    auto b = parse_source_spec("git@example.com:org/r.git#:review");
    REQUIRE(b.value().remote().origin == "git@example.com:org/r.git");
    REQUIRE(b.value().remote().ref.empty());
    REQUIRE(b.value().remote().subpath == "review");
}

TEST_CASE("unrecognized specs are InvalidArg", "[source]") {
    REQUIRE(parse_source_spec("").error().code == StowError::InvalidArg);
    REQUIRE(parse_source_spec("justaname").error().code == StowError::InvalidArg);
    REQUIRE(parse_source_spec("a/b/c").error().code == StowError::InvalidArg);
}
