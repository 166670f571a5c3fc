// SPDX-FileCopyrightText: 2025 Contributors to the upath project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file upath-mint/main.cpp
 * @brief Command line front end for the upath SDK
 *
 * Mints one unique path per invocation and prints it on stdout, so that shell scripts can
 * reserve download targets and scratch directories without racing each other.
 *
 * Usage examples:
 *   - Reserve a file for a download:     upath-mint from-id ~/Downloads https://example.com/photo.jpg
 *   - Random file name in a directory:   upath-mint random /var/spool/jobs --ext json
 *   - Random temporary file name:        upath-mint temp --ext log
 *   - Create a scratch directory:        upath-mint temp-dir --prefix build
 *   - Only pick a directory name:        upath-mint temp-dir --no-create
 *   - Check only, create nothing:        upath-mint --options '{"reservation":"advisory"}' from-id . report.pdf
 *
 * On failure the status name is printed on stderr and the exit code is non-zero.
 */

#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>
#include <CLI/CLI.hpp>
#include <fmt/format.h>
#include <upath/paths.h>
#include <upath/upath.h>

namespace
{
    /**
     * @brief Owns a generator handle for the lifetime of the tool
     */
    class Generator
    {
    public:
        explicit Generator(std::string const& options)
            : _handle{::upathCreateGenerator(options.c_str())}
        {}

        ~Generator()
        {
            if (_handle != nullptr)
            {
                ::upathDestroyGenerator(_handle);
            }
        }

        Generator(Generator const&) = delete;
        Generator& operator=(Generator const&) = delete;

        [[nodiscard]]
        ::upathGenerator get() const noexcept
        {
            return _handle;
        }

    private:
        ::upathGenerator _handle;
    };

    /**
     * @brief Call one of the path operations, growing the buffer once if the path does not fit
     *
     * @param operation Callable taking (char* out_path, size_t* inout_pathSize) and returning a status
     */
    template<typename Operation>
    int mint(char const* what, Operation&& operation)
    {
        auto buffer = std::vector<char>(256);
        auto size = buffer.size();
        auto status = operation(buffer.data(), &size);
        if (status == UPATH_ERR_STRLEN)
        {
            buffer.resize(size);
            status = operation(buffer.data(), &size);
        }

        if (status != UPATH_STATUS_OK)
        {
            std::cerr << fmt::format("ERROR: Failed to {}: {}", what, ::upathStatusToString(status)) << std::endl;
            return EXIT_FAILURE;
        }

        std::cout << buffer.data() << std::endl;
        return EXIT_SUCCESS;
    }
}

int main(int argc, char** argv)
{
    auto app = CLI::App{"upath-mint"};
    app.require_subcommand(1);
    app.footer("Environment:\n"
               "    TMPDIR           Location of temporary paths\n"
               "    UPATH_LOG_LEVEL  spdlog level specification, e.g. \"debug\"");

    auto version = ::upathVersionType{};
    ::upathGetVersion(&version);
    app.set_version_flag("--version", version.full);

    auto options = std::string{};
    app.add_option("-o,--options", options, "Generator options as a JSON object");

    auto directory = std::string{};
    auto identifier = std::string{};
    auto extension = std::string{};
    auto prefix = std::string{};

    auto fromId = app.add_subcommand("from-id", "Reserve a file named after a URI or file name");
    fromId->add_option("DIRECTORY", directory, "Target directory")->required();
    fromId->add_option("IDENTIFIER", identifier, "Absolute URI or file name")->required();

    auto random = app.add_subcommand("random", "Make a random file path in a directory (not created)");
    random->add_option("DIRECTORY", directory, "Target directory")->required();
    random->add_option("-e,--ext", extension, "File extension (default .tmp)");

    auto temp = app.add_subcommand("temp", "Make a random file path in the temporary directory (not created)");
    temp->add_option("-e,--ext", extension, "File extension (default .tmp)");

    auto tempDir = app.add_subcommand("temp-dir", "Make a unique directory in the temporary directory");
    tempDir->add_option("-p,--prefix", prefix, "Directory name prefix (default temp)");
    auto noCreateOpt = tempDir->add_flag("--no-create", "Only pick the name, do not create the directory");

    CLI11_PARSE(app, argc, argv);

    auto const generator = Generator{options};
    if (generator.get() == nullptr)
    {
        std::cerr << fmt::format("ERROR: Invalid generator options: {}", options) << std::endl;
        return EXIT_FAILURE;
    }

    if (fromId->parsed())
    {
        return mint("reserve a file",
            [&](char* out, size_t* size)
            { return ::upathReserveFileFromIdentifier(generator.get(), directory.c_str(), identifier.c_str(), nullptr, out, size); });
    }
    if (random->parsed())
    {
        return mint("make a random file path",
            [&](char* out, size_t* size) { return ::upathMakeRandomFilePath(generator.get(), directory.c_str(), extension.c_str(), nullptr, out, size); });
    }
    if (temp->parsed())
    {
        return mint("make a random temporary file path",
            [&](char* out, size_t* size) { return ::upathMakeRandomTempFilePath(generator.get(), extension.c_str(), nullptr, out, size); });
    }
    if (tempDir->parsed())
    {
        auto const create = noCreateOpt->count() == 0;
        return mint("make a temporary directory",
            [&](char* out, size_t* size) { return ::upathMakeUniqueTempDirectory(generator.get(), prefix.c_str(), create, nullptr, out, size); });
    }

    std::cerr << "No action specified. Use --help for usage information." << std::endl;
    return EXIT_FAILURE;
}
