#include <catch2/catch_test_macros.hpp>

#include "env/os_release.hpp"
#include "fixtures.hpp"

TEST_CASE("parse_release_file", "[os-release]") {

    SECTION("QuotedAndBareValues") {
        auto kv = parse_release_file(
            "NAME=\"Fedora Linux\"\n"
            "ID=fedora\n"
            "VERSION_ID=39\n"
            "PRETTY_NAME='Fedora Linux 39 (Workstation Edition)'\n");
        REQUIRE(kv["NAME"] == "Fedora Linux");
        REQUIRE(kv["ID"] == "fedora");
        REQUIRE(kv["VERSION_ID"] == "39");
        REQUIRE(kv["PRETTY_NAME"] == "Fedora Linux 39 (Workstation Edition)");
    }

    SECTION("SkipsCommentsAndMalformedLines") {
        auto kv = parse_release_file("# comment\n\nnot a pair\n=value\n  ID = arch  \n");
        REQUIRE(kv.size() == 1);
        REQUIRE(kv["ID"] == "arch");
    }

    SECTION("EmptyInput") {
        REQUIRE(parse_release_file("").empty());
    }
}

TEST_CASE("detect_distro", "[os-release]") {
    FakeSystemSource source;

    SECTION("NixosFromId") {
        source.files["/etc/os-release"] = "ID=nixos\nVERSION_ID=\"24.05\"\n";
        auto info = detect_distro(source);
        REQUIRE(info.id == "nixos");
        REQUIRE(info.version == "24.05");
    }

    SECTION("NameUsedWhenIdMissing") {
        source.files["/etc/os-release"] = "NAME=\"NixOS\"\nVERSION_ID=\"24.11\"\n";
        REQUIRE(detect_distro(source).id == "nixos");
    }

    SECTION("VersionFallsBackToLeadingToken") {
        source.files["/etc/os-release"] = "ID=nixos\nVERSION=\"24.11 (Vicuna) (pre)\"\n";
        REQUIRE(detect_distro(source).version == "24.11");
    }

    SECTION("NixosMarkerWinsOverReleaseFile") {
        source.files["/etc/os-release"] = "ID=linux\n";
        source.files["/etc/NIXOS"] = "";
        REQUIRE(detect_distro(source).id == "nixos");
    }

    SECTION("IdIsLowerCased") {
        source.files["/etc/os-release"] = "ID=Ubuntu\nVERSION_ID=\"24.04\"\nVARIANT_ID=Server\n";
        auto info = detect_distro(source);
        REQUIRE(info.id == "ubuntu");
        REQUIRE(info.variant == "server");
    }

    SECTION("UsrLibFallback") {
        source.files["/usr/lib/os-release"] = "ID=opensuse-tumbleweed\n";
        REQUIRE(detect_distro(source).id == "opensuse-tumbleweed");
    }

    SECTION("LsbReleaseFallback") {
        source.files["/etc/lsb-release"] = "DISTRIB_ID=LinuxMint\nDISTRIB_RELEASE=21.3\n";
        auto info = detect_distro(source);
        REQUIRE(info.id == "linuxmint");
        REQUIRE(info.version == "21.3");
    }

    SECTION("ArchMarkerOnlyWithoutOtherSource") {
        source.files["/etc/arch-release"] = "";
        REQUIRE(detect_distro(source).id == "arch");

        source.files["/etc/os-release"] = "ID=endeavouros\n";
        REQUIRE(detect_distro(source).id == "endeavouros");
    }

    SECTION("NothingAvailable") {
        auto info = detect_distro(source);
        REQUIRE(info.id.empty());
        REQUIRE(info.version.empty());
    }
}

TEST_CASE("wraps_binaries", "[os-release]") {
    REQUIRE(wraps_binaries("nixos"));
    REQUIRE(wraps_binaries("guix"));
    REQUIRE_FALSE(wraps_binaries("fedora"));
    REQUIRE_FALSE(wraps_binaries(""));
}
