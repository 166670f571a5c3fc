// SPDX-FileCopyrightText: 2025 Contributors to the upath project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file test_unique_path_generator.cpp
 * @brief Unit tests for UniquePathGenerator
 *
 * This test suite validates the four path operations:
 *   - reserveFileFromIdentifier: numbered candidates, the reserved file exists and is empty
 *   - makeRandomFilePath / makeRandomTempFilePath: token names, nothing created
 *   - makeUniqueTempDirectory: prefixed names, created or only checked
 *
 * and their failure modes:
 *   - Missing target directory reported as UPATH_ERR_DIRECTORY_NOT_FOUND
 *   - Cancellation before any filesystem access, and between two candidates
 *   - Exhaustion of the attempt limit
 *
 * A concurrent test reserves the same identifier from several threads to verify that no
 * path is handed out twice.
 *
 * All tests run inside a ScratchDirectoryFixture, temporary paths are redirected to it
 * with GeneratorOptions::tempDirectory.
 */

#include <algorithm>
#include <cstddef>
#include <memory>
#include <set>
#include <stop_token>
#include <string>
#include <thread>
#include <utility>
#include <vector>
#include <catch2/catch_test_macros.hpp>
#include "upath-internal/Exception.hpp"
#include "upath-internal/ReservationStrategy.hpp"
#include "upath-internal/UniquePathGenerator.hpp"
#include "Utils.hpp"

using namespace upath::lib;

namespace
{
    class GeneratorFixture : public upath::tests::ScratchDirectoryFixture
    {
    protected:
        GeneratorOptions scratchGeneratorOptions() const
        {
            auto options = GeneratorOptions{};
            options.tempDirectory = scratch;
            return options;
        }

        template<typename F>
        static upathStatus statusOf(F&& f)
        {
            try
            {
                f();
                return UPATH_STATUS_OK;
            }
            catch (Exception const& e)
            {
                return e.status();
            }
        }
    };

    /**
     * Exclusive create that requests a stop once a given number of candidates collided.
     */
    class StopAfterCollisionsStrategy final : public ReservationStrategy
    {
    public:
        StopAfterCollisionsStrategy(std::stop_source source, std::size_t collisionsBeforeStop)
            : _inner{makeExclusiveCreateStrategy()}
            , _source{std::move(source)}
            , _collisionsBeforeStop{collisionsBeforeStop}
        {}

        ReservationOutcome tryReserve(std::filesystem::path const& candidate) const override
        {
            auto const outcome = _inner->tryReserve(candidate);
            if ((outcome == ReservationOutcome::Collision) && (++_collisions == _collisionsBeforeStop))
            {
                _source.request_stop();
            }
            return outcome;
        }

        [[nodiscard]]
        bool createsEntry() const noexcept override
        {
            return true;
        }

        [[nodiscard]]
        char const* name() const noexcept override
        {
            return "stop-after-collisions";
        }

        [[nodiscard]]
        std::size_t collisions() const noexcept
        {
            return _collisions;
        }

    private:
        std::unique_ptr<ReservationStrategy> _inner;
        mutable std::stop_source _source;
        std::size_t _collisionsBeforeStop;
        mutable std::size_t _collisions = 0;
    };

    bool startsWith(std::string const& s, std::string const& prefix)
    {
        return s.compare(0, prefix.size(), prefix) == 0;
    }
}

/**
 * @brief Numbered candidates for a repeated identifier
 *
 * The first reservation keeps the published name, the second one inserts "(1)" before the
 * extension.  Both files exist afterwards and are empty.
 */
TEST_CASE_METHOD(GeneratorFixture, "Reserve file from identifier", "[generator]")
{
    auto const generator = UniquePathGenerator{scratchGeneratorOptions()};
    REQUIRE(generator.reservesFiles());

    auto const first = generator.reserveFileFromIdentifier(scratch, "https://example.com/photo.jpg");
    auto const second = generator.reserveFileFromIdentifier(scratch, "https://example.com/photo.jpg");

    REQUIRE(first == scratch / "photo.jpg");
    REQUIRE(second == scratch / "photo(1).jpg");

    for (auto const& path : {first, second})
    {
        REQUIRE(path.parent_path() == scratch);
        REQUIRE(std::filesystem::is_regular_file(path));
        REQUIRE(std::filesystem::file_size(path) == 0);
    }
}

TEST_CASE_METHOD(GeneratorFixture, "Reserve file skips occupied names", "[generator]")
{
    auto const generator = UniquePathGenerator{scratchGeneratorOptions()};

    upath::tests::touch(scratch / "report.pdf");
    std::filesystem::create_directory(scratch / "report(1).pdf");

    REQUIRE(generator.reserveFileFromIdentifier(scratch, "report.pdf") == scratch / "report(2).pdf");
}

TEST_CASE_METHOD(GeneratorFixture, "Reserve file with unusable identifiers", "[generator]")
{
    auto options = scratchGeneratorOptions();
    SECTION("Default base name")
    {
        auto const generator = UniquePathGenerator{options};
        REQUIRE(generator.reserveFileFromIdentifier(scratch, "https://example.com/") == scratch / "file");
        REQUIRE(generator.reserveFileFromIdentifier(scratch, "..") == scratch / "file(1)");
    }

    SECTION("Configured base name")
    {
        options.defaultBaseName = "download";
        auto const generator = UniquePathGenerator{options};
        REQUIRE(generator.reserveFileFromIdentifier(scratch, "") == scratch / "download");
    }

    // Nothing escaped the target directory
    REQUIRE(std::filesystem::exists(scratch));
    for (auto const& entry : std::filesystem::directory_iterator{scratch})
    {
        REQUIRE(entry.path().parent_path() == scratch);
    }
}

TEST_CASE_METHOD(GeneratorFixture, "Missing target directory", "[generator]")
{
    auto const generator = UniquePathGenerator{scratchGeneratorOptions()};
    auto const missing = scratch / "does" / "not" / "exist";

    REQUIRE(statusOf([&] { static_cast<void>(generator.reserveFileFromIdentifier(missing, "photo.jpg")); }) == UPATH_ERR_DIRECTORY_NOT_FOUND);

    // A regular file is not a directory either
    upath::tests::touch(scratch / "plain");
    REQUIRE(statusOf([&] { static_cast<void>(generator.reserveFileFromIdentifier(scratch / "plain", "photo.jpg")); }) ==
            UPATH_ERR_DIRECTORY_NOT_FOUND);

    REQUIRE_FALSE(std::filesystem::exists(missing));
}

TEST_CASE_METHOD(GeneratorFixture, "Advisory reservation", "[generator]")
{
    auto options = scratchGeneratorOptions();
    options.reservation = ReservationMode::Advisory;
    auto const generator = UniquePathGenerator{options};
    REQUIRE_FALSE(generator.reservesFiles());

    auto const path = generator.reserveFileFromIdentifier(scratch, "photo.jpg");
    REQUIRE(path == scratch / "photo.jpg");
    REQUIRE_FALSE(std::filesystem::exists(path));

    upath::tests::touch(path);
    REQUIRE(generator.reserveFileFromIdentifier(scratch, "photo.jpg") == scratch / "photo(1).jpg");
}

/**
 * @brief Random file names
 *
 * 10,000 paths in a row must all be distinct.  None of them is created.
 */
TEST_CASE_METHOD(GeneratorFixture, "Random file paths", "[generator]")
{
    auto const generator = UniquePathGenerator{scratchGeneratorOptions()};

    auto seen = std::set<std::filesystem::path>{};
    for (auto i = 0; i < 10'000; ++i)
    {
        auto const path = generator.makeRandomFilePath(scratch, "png");
        REQUIRE(path.parent_path() == scratch);
        REQUIRE(path.extension() == ".png");
        REQUIRE(seen.insert(path).second);
    }

    REQUIRE(upath::tests::countEntries(scratch) == 0);

    REQUIRE(generator.makeRandomFilePath(scratch, "").extension() == ".tmp");
    REQUIRE(generator.makeRandomFilePath(scratch, ".bin").extension() == ".bin");

    REQUIRE(statusOf([&] { static_cast<void>(generator.makeRandomFilePath(scratch, "x/y")); }) == UPATH_ERR_INVALID_ARG);
}

TEST_CASE_METHOD(GeneratorFixture, "Random temp file paths", "[generator]")
{
    auto const generator = UniquePathGenerator{scratchGeneratorOptions()};
    REQUIRE(generator.tempDirectory() == scratch);

    auto const path = generator.makeRandomTempFilePath("log");
    REQUIRE(path.parent_path() == scratch);
    REQUIRE(path.extension() == ".log");
    REQUIRE_FALSE(std::filesystem::exists(path));
}

TEST_CASE("Random temp file paths in the system temp directory", "[generator]")
{
    auto const generator = UniquePathGenerator{};
    auto const path = generator.makeRandomTempFilePath("");

    REQUIRE(path == generator.tempDirectory() / path.filename());
    REQUIRE(path.extension() == ".tmp");
    REQUIRE_FALSE(std::filesystem::exists(path));
}

TEST_CASE_METHOD(GeneratorFixture, "Unique temp directories", "[generator]")
{
    auto const generator = UniquePathGenerator{scratchGeneratorOptions()};

    SECTION("Created")
    {
        auto const a = generator.makeUniqueTempDirectory("build", true);
        auto const b = generator.makeUniqueTempDirectory("build", true);

        REQUIRE(a != b);
        for (auto const& path : {a, b})
        {
            REQUIRE(path.parent_path() == scratch);
            REQUIRE(startsWith(path.filename().string(), "build_"));
            REQUIRE(std::filesystem::is_directory(path));
        }
    }

    SECTION("Only checked")
    {
        auto const path = generator.makeUniqueTempDirectory("build", false);
        REQUIRE(startsWith(path.filename().string(), "build_"));
        REQUIRE_FALSE(std::filesystem::exists(path));
    }

    SECTION("Default prefix")
    {
        auto const path = generator.makeUniqueTempDirectory();
        REQUIRE(startsWith(path.filename().string(), "temp_"));
        REQUIRE(std::filesystem::is_directory(path));
    }

    SECTION("Invalid prefix")
    {
        REQUIRE(statusOf([&] { static_cast<void>(generator.makeUniqueTempDirectory("a/b")); }) == UPATH_ERR_INVALID_ARG);
        REQUIRE(upath::tests::countEntries(scratch) == 0);
    }
}

TEST_CASE_METHOD(GeneratorFixture, "Missing temp directory", "[generator]")
{
    auto options = scratchGeneratorOptions();
    options.tempDirectory = scratch / "gone";
    auto const generator = UniquePathGenerator{options};

    REQUIRE(statusOf([&] { static_cast<void>(generator.makeUniqueTempDirectory("build", true)); }) == UPATH_ERR_DIRECTORY_NOT_FOUND);
}

/**
 * @brief Cancellation requested before the call
 *
 * Every operation must report UPATH_ERR_CANCELLED and leave the directory untouched.
 */
TEST_CASE_METHOD(GeneratorFixture, "Cancelled before start", "[generator]")
{
    auto const generator = UniquePathGenerator{scratchGeneratorOptions()};
    auto source = std::stop_source{};
    source.request_stop();
    auto const token = source.get_token();

    REQUIRE(statusOf([&] { static_cast<void>(generator.reserveFileFromIdentifier(scratch, "photo.jpg", token)); }) == UPATH_ERR_CANCELLED);
    REQUIRE(statusOf([&] { static_cast<void>(generator.makeRandomFilePath(scratch, "png", token)); }) == UPATH_ERR_CANCELLED);
    REQUIRE(statusOf([&] { static_cast<void>(generator.makeRandomTempFilePath("png", token)); }) == UPATH_ERR_CANCELLED);
    REQUIRE(statusOf([&] { static_cast<void>(generator.makeUniqueTempDirectory("build", true, token)); }) == UPATH_ERR_CANCELLED);

    // Cancellation wins over a missing directory
    REQUIRE(statusOf([&] { static_cast<void>(generator.reserveFileFromIdentifier(scratch / "missing", "photo.jpg", token)); }) ==
            UPATH_ERR_CANCELLED);

    REQUIRE(upath::tests::countEntries(scratch) == 0);
}

/**
 * @brief Cancellation between two candidates
 *
 * The stop is requested while the loop is busy with an occupied name.  The next iteration must
 * report UPATH_ERR_CANCELLED without trying another candidate, and files reserved by earlier calls
 * stay where they are.
 */
TEST_CASE_METHOD(GeneratorFixture, "Cancelled after a collision", "[generator]")
{
    upath::tests::touch(scratch / "photo.jpg");
    upath::tests::touch(scratch / "photo(1).jpg");

    auto source = std::stop_source{};
    auto strategy = std::make_unique<StopAfterCollisionsStrategy>(source, 3);
    auto const& counter = *strategy;
    auto const generator = UniquePathGenerator{scratchGeneratorOptions(), std::move(strategy)};
    auto const token = source.get_token();

    // Two collisions, then a reservation: the stop has not been requested yet
    REQUIRE(generator.reserveFileFromIdentifier(scratch, "photo.jpg", token) == scratch / "photo(2).jpg");
    REQUIRE_FALSE(token.stop_requested());

    // The third collision requests the stop
    REQUIRE(statusOf([&] { static_cast<void>(generator.reserveFileFromIdentifier(scratch, "photo.jpg", token)); }) == UPATH_ERR_CANCELLED);
    REQUIRE(token.stop_requested());
    REQUIRE(counter.collisions() == 3);

    REQUIRE(std::filesystem::is_regular_file(scratch / "photo(2).jpg"));
    REQUIRE_FALSE(std::filesystem::exists(scratch / "photo(3).jpg"));
    REQUIRE(upath::tests::countEntries(scratch) == 3);
}

TEST_CASE("Generator without a file reservation strategy", "[generator]")
{
    try
    {
        static_cast<void>(UniquePathGenerator{GeneratorOptions{}, nullptr});
        FAIL("Expected an exception");
    }
    catch (Exception const& e)
    {
        REQUIRE(e.status() == UPATH_ERR_INVALID_ARG);
    }
}

TEST_CASE_METHOD(GeneratorFixture, "Attempt limit", "[generator]")
{
    auto options = scratchGeneratorOptions();
    options.maxAttempts = 3;
    auto const generator = UniquePathGenerator{options};

    for (auto i = 0; i < 3; ++i)
    {
        static_cast<void>(generator.reserveFileFromIdentifier(scratch, "photo.jpg"));
    }
    REQUIRE(statusOf([&] { static_cast<void>(generator.reserveFileFromIdentifier(scratch, "photo.jpg")); }) == UPATH_ERR_EXHAUSTED);
    REQUIRE(upath::tests::countEntries(scratch) == 3);

    options.maxAttempts = 0;
    REQUIRE(statusOf([&] { static_cast<void>(UniquePathGenerator{options}); }) == UPATH_ERR_INVALID_ARG);
}

/**
 * @brief Concurrent reservation of one identifier
 *
 * Several threads reserve "photo.jpg" in the same directory.  Every returned path must be
 * distinct and the directory must hold exactly one file per call.
 */
TEST_CASE_METHOD(GeneratorFixture, "Concurrent reservation", "[generator][concurrency]")
{
    constexpr auto const threadCount = 8;
    constexpr auto const callsPerThread = 25;

    auto const generator = UniquePathGenerator{scratchGeneratorOptions()};
    auto results = std::vector<std::vector<std::filesystem::path>>(threadCount);

    {
        auto threads = std::vector<std::jthread>{};
        for (auto t = 0; t < threadCount; ++t)
        {
            threads.emplace_back(
                [&generator, &results, this, t]()
                {
                    for (auto i = 0; i < callsPerThread; ++i)
                    {
                        results[t].push_back(generator.reserveFileFromIdentifier(scratch, "https://example.com/photo.jpg"));
                    }
                });
        }
    }

    auto all = std::set<std::filesystem::path>{};
    for (auto const& perThread : results)
    {
        REQUIRE(perThread.size() == callsPerThread);
        all.insert(perThread.begin(), perThread.end());
    }

    REQUIRE(all.size() == threadCount * callsPerThread);
    REQUIRE(upath::tests::countEntries(scratch) == threadCount * callsPerThread);
    REQUIRE(all.count(scratch / "photo.jpg") == 1);
}
