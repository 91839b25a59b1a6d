#include "manifest.hpp"
#include "test_support.hpp"

#include <sstream>
#include <stdexcept>

using namespace testing_support;

namespace
{
    const std::string SHA256_HEX = "b94d27b9934d3e08a52e52d7da7dabfac484efe37a5380ee9088f7ace2efcde9";

    std::string parseError(const std::string &text)
    {
        std::istringstream input(text);
        try
        {
            parseManifest(input);
        }
        catch (const std::runtime_error &e)
        {
            return e.what();
        }
        return "";
    }

    void test_parses_entries_in_order(TestContext &t)
    {
        std::istringstream input(
            "# nightly mirror\n"
            "\n"
            "https://example.test/a.iso  out/a.iso\n"
            "   http://example.test/b.bin out/b.bin sha256:" + SHA256_HEX + "\n"
            "https://example.test/c.tar\tout/c.tar md5:5EB63BBBE01EEED093CB22BB8F5ACDC3\n");

        auto specs = parseManifest(input);
        t.check(specs.size() == 3, "three transfers expected");
        if (specs.size() != 3)
        {
            return;
        }

        t.check(specs[0].sourceUrl == "https://example.test/a.iso", "first URL");
        t.check(specs[0].destinationPath == std::filesystem::path("out/a.iso"), "first destination");
        t.check(!specs[0].expectedDigest, "first entry has no digest");

        t.check(specs[1].expectedDigest && *specs[1].expectedDigest == SHA256_HEX, "second digest");
        t.check(specs[1].digestAlgorithm == ChecksumVerifier::Algorithm::SHA256, "second algorithm");

        t.check(specs[2].digestAlgorithm == ChecksumVerifier::Algorithm::MD5, "third algorithm");
        t.check(specs[2].expectedDigest && *specs[2].expectedDigest == "5eb63bbbe01eeed093cb22bb8f5acdc3",
                "digest is normalized to lower case");
    }

    void test_empty_manifest(TestContext &t)
    {
        std::istringstream input("\n# only comments\n\n");
        t.check(parseManifest(input).empty(), "comments and blank lines yield no transfers");
    }

    void test_rejects_malformed_lines(TestContext &t)
    {
        t.checkContains(parseError("https://example.test/a\n"), "line 1", "missing destination names the line");
        t.checkContains(parseError("# c\nftp://example.test/a out/a\n"), "line 2", "unsupported scheme names the line");
        t.checkContains(parseError("https://example.test/a out/a sha256:abc\n"), "line 1", "bad checksum names the line");
        t.checkContains(parseError("https://example.test/a out/a md5:" + std::string(32, '0') + " extra\n"),
                        "unexpected field", "extra fields are rejected");
    }

    void test_load_manifest_from_file(TestContext &t)
    {
        TempDir dir("manifest");
        auto path = dir / "batch.txt";
        writeFile(path, "https://example.test/x out/x\n");

        auto specs = loadManifest(path);
        t.check(specs.size() == 1, "manifest file should load one transfer");

        bool threw = false;
        try
        {
            loadManifest(dir / "missing.txt");
        }
        catch (const std::runtime_error &)
        {
            threw = true;
        }
        t.check(threw, "missing manifest should throw");
    }

    void test_supported_urls(TestContext &t)
    {
        t.check(isSupportedUrl("http://host/x"), "http is supported");
        t.check(isSupportedUrl("https://host/x"), "https is supported");
        t.check(!isSupportedUrl("ftp://host/x"), "ftp is not supported");
        t.check(!isSupportedUrl("host/x"), "scheme is required");
    }
}

int main()
{
    TestContext t;
    test_parses_entries_in_order(t);
    test_empty_manifest(t);
    test_rejects_malformed_lines(t);
    test_load_manifest_from_file(t);
    test_supported_urls(t);
    return t.finish("manifest_tests");
}
