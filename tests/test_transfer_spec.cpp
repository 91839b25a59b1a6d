#include "test_support.hpp"
#include "transfer_spec.hpp"

using namespace testing_support;

namespace
{
    void test_sanitize_replaces_reserved_characters(TestContext &t)
    {
        auto sanitized = sanitizeDestination("downloads/a:b*c?.txt");
        t.check(sanitized == std::filesystem::path("downloads/a_b_c_.txt"),
                fmt::format("reserved characters should become '_' (got {})", sanitized.string()));

        sanitized = sanitizeDestination("out/<name>|\"q\".bin");
        t.check(sanitized.filename() == "_name___q_.bin",
                fmt::format("angle brackets, pipe and quotes are replaced (got {})", sanitized.string()));

        sanitized = sanitizeDestination("dir/back\\slash.iso");
        t.check(sanitized.filename() == "back_slash.iso", "backslash in a file name is replaced");
    }

    void test_sanitize_keeps_parent_directories(TestContext &t)
    {
        auto sanitized = sanitizeDestination("some/nested/dir/file?.zip");
        t.check(sanitized.parent_path() == std::filesystem::path("some/nested/dir"),
                "parent directories should be left as given");
    }

    void test_sanitize_leaves_clean_names_alone(TestContext &t)
    {
        t.check(sanitizeDestination("plain.bin") == std::filesystem::path("plain.bin"), "clean name unchanged");
        t.check(sanitizeDestination("a/b/report-2024_v1.pdf") == std::filesystem::path("a/b/report-2024_v1.pdf"),
                "dashes and underscores are legal");
    }

    void test_sanitize_is_deterministic(TestContext &t)
    {
        std::filesystem::path input = "x/y:z.dat";
        t.check(sanitizeDestination(input) == sanitizeDestination(input), "same input, same output");
        t.check(sanitizeDestination(sanitizeDestination(input)) == sanitizeDestination(input),
                "sanitizing twice changes nothing");
    }

    void test_working_path(TestContext &t)
    {
        t.check(workingPathFor("dl/file.iso") == std::filesystem::path("dl/file.iso.part"),
                "working file is the destination plus .part");
        t.check(std::string(WORKING_FILE_SUFFIX) == ".part", "suffix constant");
    }

    void test_task_label(TestContext &t)
    {
        TransferSpec spec;
        spec.sourceUrl = "https://example.test/a";
        spec.destinationPath = "downloads/week:1.csv";
        t.check(taskLabelFor(spec) == "downloads/week_1.csv", "label is the parent plus sanitized file name");

        spec.destinationPath = "week:1.csv";
        t.check(taskLabelFor(spec) == "week_1.csv", "bare file name without a parent");

        TransferSpec other = spec;
        spec.destinationPath = "mirror/a/data.bin";
        other.destinationPath = "mirror/b/data.bin";
        t.check(taskLabelFor(spec) != taskLabelFor(other), "same file name in different folders stays distinct");
    }

    void test_spec_defaults(TestContext &t)
    {
        TransferSpec spec;
        t.check(!spec.expectedDigest.has_value(), "no digest by default");
        t.check(spec.digestAlgorithm == ChecksumVerifier::Algorithm::SHA256, "sha256 by default");
    }
}

int main()
{
    TestContext t;
    test_sanitize_replaces_reserved_characters(t);
    test_sanitize_keeps_parent_directories(t);
    test_sanitize_leaves_clean_names_alone(t);
    test_sanitize_is_deterministic(t);
    test_working_path(t);
    test_task_label(t);
    test_spec_defaults(t);
    return t.finish("transfer_spec_tests");
}
