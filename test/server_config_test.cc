#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "serverConfig.h"
#include "testSupport.h"

namespace
{

cli_result run(std::vector<std::string> args, server_config* config, std::string* error)
{
    args.insert(args.begin(), "muduostatic");
    std::vector<char*> argv;
    for (std::string& arg : args)
    {
        argv.push_back(&arg[0]);
    }
    argv.push_back(nullptr);
    return parse_command_line(static_cast<int>(args.size()), argv.data(), config, error);
}

}  // namespace

TEST(ServerConfigTest, Defaults)
{
    server_config config;
    std::string error;
    ASSERT_EQ(cli_result::RUN, run({}, &config, &error));
    EXPECT_EQ("./static", config.document_root);
    EXPECT_EQ(80, config.port);
    EXPECT_EQ(1, config.workers);
    EXPECT_EQ(0, config.threads);
    EXPECT_FALSE(config.debug);
    EXPECT_DOUBLE_EQ(30.0, config.idle_timeout);
}

TEST(ServerConfigTest, ShortOptions)
{
    server_config config;
    std::string error;
    ASSERT_EQ(cli_result::RUN,
              run({"-r", "/srv/www", "-p", "8080", "-w", "4", "-t", "2", "-i", "2.5", "-d"},
                  &config, &error)) << error;
    EXPECT_EQ("/srv/www", config.document_root);
    EXPECT_EQ(8080, config.port);
    EXPECT_EQ(4, config.workers);
    EXPECT_EQ(2, config.threads);
    EXPECT_DOUBLE_EQ(2.5, config.idle_timeout);
    EXPECT_TRUE(config.debug);
}

TEST(ServerConfigTest, LongOptions)
{
    server_config config;
    std::string error;
    ASSERT_EQ(cli_result::RUN,
              run({"--root=/tmp", "--port", "9000", "--workers=2", "--debug"}, &config, &error))
        << error;
    EXPECT_EQ("/tmp", config.document_root);
    EXPECT_EQ(9000, config.port);
    EXPECT_EQ(2, config.workers);
    EXPECT_TRUE(config.debug);
}

TEST(ServerConfigTest, RejectsBadNumbers)
{
    const std::vector<std::vector<std::string>> cases = {
        {"-p", "0"},
        {"-p", "65536"},
        {"-p", "80x"},
        {"-w", "0"},
        {"-t", "-1"},
        {"-i", "0"},
        {"-i", "soon"},
    };
    for (const auto& args : cases)
    {
        server_config config;
        std::string error;
        EXPECT_EQ(cli_result::USAGE_ERROR, run(args, &config, &error)) << args[0] << " " << args[1];
        EXPECT_FALSE(error.empty());
    }
}

TEST(ServerConfigTest, RejectsUnknownAndIncompleteOptions)
{
    server_config config;
    std::string error;
    EXPECT_EQ(cli_result::USAGE_ERROR, run({"-x"}, &config, &error));
    EXPECT_EQ(cli_result::USAGE_ERROR, run({"--bogus"}, &config, &error));
    EXPECT_EQ(cli_result::USAGE_ERROR, run({"-p"}, &config, &error));
    EXPECT_EQ(cli_result::USAGE_ERROR, run({"stray"}, &config, &error));
}

TEST(ServerConfigTest, Help)
{
    server_config config;
    std::string error;
    EXPECT_EQ(cli_result::HELP, run({"-h"}, &config, &error));
    EXPECT_EQ(cli_result::HELP, run({"--help"}, &config, &error));
    EXPECT_NE(std::string::npos, usage("muduostatic").find("--root"));
}

TEST(ServerConfigTest, ValidateCanonicalizesRoot)
{
    temp_dir dir;
    dir.make_dir("site");
    dir.make_symlink("site", "current");

    server_config config;
    config.document_root = dir.join("current") + "/./";
    std::string error;
    ASSERT_TRUE(validate_config(&config, &error)) << error;
    EXPECT_EQ(dir.join("site"), config.document_root);
}

TEST(ServerConfigTest, ValidateRejectsMissingOrFileRoot)
{
    temp_dir dir;
    dir.write_file("plain.txt", "x");

    server_config config;
    std::string error;
    config.document_root = dir.join("missing");
    EXPECT_FALSE(validate_config(&config, &error));
    EXPECT_NE(std::string::npos, error.find("does not exist"));

    config.document_root = dir.join("plain.txt");
    EXPECT_FALSE(validate_config(&config, &error));
    EXPECT_NE(std::string::npos, error.find("not a directory"));
}
