// SECPCORE - Command Line Tests
// Copyright (c) 2024 SECPCORE Developers
// MIT License

#include <gtest/gtest.h>

#include "secpcore/cli/app.h"
#include "secpcore/util/logging.h"

#include <cstdio>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

#include <unistd.h>

namespace secpcore {
namespace cli {
namespace test {

namespace {

const std::string P_HEX = "fffffffffffffffffffffffffffffffffffffffffffffffffffffffefffffc2f";
const std::string G_X = "79be667ef9dcbbac55a06295ce870b07029bfcdb2dce28d959f2815b16f81798";
const std::string G_Y = "483ada7726a3c4655da4fbfc0e1108a8fd17b448a68554199c47d08ffb10d4b8";
const std::string NEG_G_Y = "b7c52588d95c3b9aa25b0403f1eef75702e84bb7597aabe663b82f6f04ef2777";
const std::string G2_X = "c6047f9441ed7d6d3045406e95c07cd85c778e4b8cef3ca7abac09b95c709ee5";
const std::string G2_Y = "1ae168fea63dc339a3c58419466ceaeef7f632653266d0e1236431a950cfe52a";
const std::string G3_X = "f9308a019258c31049344f85f89d5229b531c845836f99b08601f113bce036f9";
const std::string G3_Y = "388f7b0f632de8140fe337e62a37f3566500a99934c2231b6cb9fd7584b8e672";

const std::string LIFT1_EVEN_Y = "4218f20ae6c646b363db68605822fb14264ca8d2587fdd6fbc750d587e76a7ee";
const std::string LIFT1_ODD_Y = "bde70df51939b94c9c24979fa7dd04ebd9b3572da7802290438af2a681895441";

std::string PointText(const std::string& x, const std::string& y) {
    return "(x=0x" + x + ", y=0x" + y + ")\n";
}

struct CliResult {
    int rc;
    std::string out;
    std::string err;
};

} // anonymous namespace

class CliTest : public ::testing::Test {
protected:
    void TearDown() override {
        util::Logger::Instance().ClearSinks();
        util::Logger::Instance().SetLevel(util::LogLevel::Info);
        for (const auto& file : tempFiles_) {
            std::remove(file.c_str());
        }
    }

    /// Runs secpcore-cli with console logging off
    CliResult Invoke(const std::vector<std::string>& args) {
        std::vector<std::string> storage = {"secpcore-cli", "--noprinttoconsole"};
        storage.insert(storage.end(), args.begin(), args.end());

        std::vector<const char*> argv;
        for (const auto& arg : storage) {
            argv.push_back(arg.c_str());
        }

        std::ostringstream out;
        std::ostringstream err;
        int rc = cli::Run(static_cast<int>(argv.size()), argv.data(), out, err);
        return {rc, out.str(), err.str()};
    }

    std::string TempPath() {
        char filename[] = "/tmp/secpcore_cli_test_XXXXXX";
        int fd = mkstemp(filename);
        if (fd >= 0) {
            close(fd);
        }
        tempFiles_.push_back(filename);
        return filename;
    }

    static std::string ReadFile(const std::string& path) {
        std::ifstream in(path);
        std::stringstream buffer;
        buffer << in.rdbuf();
        return buffer.str();
    }

    std::vector<std::string> tempFiles_;
};

// ============================================================================
// sample
// ============================================================================

TEST_F(CliTest, SamplePrintsElementIdentityAndGenerator) {
    auto result = Invoke({"sample"});
    EXPECT_EQ(result.rc, EXIT_OK);
    EXPECT_TRUE(result.err.empty());

    std::string expected =
        "FieldElement_0x" + std::string(62, '0') + "ff_(mod 0x" + P_HEX + ")\n" +
        "(Infinity)\n" +
        PointText(G_X, G_Y);
    EXPECT_EQ(result.out, expected);
}

TEST_F(CliTest, SampleTakesNoArguments) {
    auto result = Invoke({"sample", "1"});
    EXPECT_EQ(result.rc, EXIT_USAGE);
    EXPECT_TRUE(result.out.empty());
    EXPECT_NE(result.err.find("Wrong number of arguments for 'sample'"), std::string::npos);
}

// ============================================================================
// field and point
// ============================================================================

TEST_F(CliTest, FieldPrintsElement) {
    auto result = Invoke({"field", "0xFF"});
    EXPECT_EQ(result.rc, EXIT_OK);
    EXPECT_EQ(result.out.rfind("FieldElement_0x" + std::string(62, '0') + "ff_", 0), 0u);
}

TEST_F(CliTest, FieldOutOfRangeIsCurveError) {
    auto result = Invoke({"field", "0x" + P_HEX});
    EXPECT_EQ(result.rc, EXIT_EC_ERROR);
    EXPECT_TRUE(result.out.empty());
    EXPECT_NE(result.err.find("not in the field range"), std::string::npos);
}

TEST_F(CliTest, PointOnCurve) {
    auto result = Invoke({"point", "0x" + G_X, G_Y});
    EXPECT_EQ(result.rc, EXIT_OK);
    EXPECT_EQ(result.out, PointText(G_X, G_Y));
}

TEST_F(CliTest, PointOffCurveExitsWithCurveError) {
    auto result = Invoke({"point", "1", "2"});
    EXPECT_EQ(result.rc, EXIT_EC_ERROR);
    EXPECT_TRUE(result.out.empty());
    EXPECT_EQ(result.err.rfind("Error: ", 0), 0u);
    EXPECT_NE(result.err.find("not on the secp256k1 curve"), std::string::npos);
}

TEST_F(CliTest, PointWrongArgumentCount) {
    EXPECT_EQ(Invoke({"point", "1"}).rc, EXIT_USAGE);
    EXPECT_EQ(Invoke({"point", "1", "2", "3"}).rc, EXIT_USAGE);
    EXPECT_EQ(Invoke({"field"}).rc, EXIT_USAGE);
    EXPECT_EQ(Invoke({"add", G_X, G_Y, G2_X}).rc, EXIT_USAGE);
}

TEST_F(CliTest, MalformedHexIsParseError) {
    auto result = Invoke({"field", "0xzz"});
    EXPECT_EQ(result.rc, EXIT_USAGE);
    EXPECT_NE(result.err.find("Invalid number"), std::string::npos);
}

// ============================================================================
// lift
// ============================================================================

TEST_F(CliTest, LiftDefaultsToEven) {
    auto result = Invoke({"lift", "1"});
    EXPECT_EQ(result.rc, EXIT_OK);
    EXPECT_EQ(result.out, PointText(std::string(63, '0') + "1", LIFT1_EVEN_Y));
}

TEST_F(CliTest, LiftHonorsParity) {
    std::string x = std::string(63, '0') + "1";
    EXPECT_EQ(Invoke({"lift", "1", "even"}).out, PointText(x, LIFT1_EVEN_Y));
    EXPECT_EQ(Invoke({"lift", "1", "odd"}).out, PointText(x, LIFT1_ODD_Y));
}

TEST_F(CliTest, LiftRejectsUnknownParity) {
    auto result = Invoke({"lift", "1", "up"});
    EXPECT_EQ(result.rc, EXIT_USAGE);
    EXPECT_TRUE(result.out.empty());
    EXPECT_NE(result.err.find("Parity must be 'even' or 'odd', got 'up'"), std::string::npos);
}

TEST_F(CliTest, LiftWithoutCurvePoint) {
    // 5^3 + 7 is not a square mod p
    auto result = Invoke({"lift", "5"});
    EXPECT_EQ(result.rc, EXIT_EC_ERROR);
    EXPECT_NE(result.err.find("No curve point has x"), std::string::npos);
}

// ============================================================================
// mul and add
// ============================================================================

TEST_F(CliTest, MulByScalar) {
    EXPECT_EQ(Invoke({"mul", "2"}).out, PointText(G2_X, G2_Y));
    EXPECT_EQ(Invoke({"mul", "0x3"}).out, PointText(G3_X, G3_Y));
    EXPECT_EQ(Invoke({"mul", "0"}).out, "(Infinity)\n");
}

TEST_F(CliTest, MulByNegativeScalar) {
    auto result = Invoke({"mul", "-1"});
    EXPECT_EQ(result.rc, EXIT_OK);
    EXPECT_EQ(result.out, PointText(G_X, NEG_G_Y));
}

TEST_F(CliTest, MulByOrderIsInfinity) {
    auto result = Invoke(
        {"mul", "0xfffffffffffffffffffffffffffffffebaaedce6af48a03bbfd25e8cd0364141"});
    EXPECT_EQ(result.rc, EXIT_OK);
    EXPECT_EQ(result.out, "(Infinity)\n");
}

TEST_F(CliTest, MulRejectsMalformedScalar) {
    auto result = Invoke({"mul", "12abc"});
    EXPECT_EQ(result.rc, EXIT_USAGE);
    EXPECT_TRUE(result.out.empty());
    EXPECT_NE(result.err.find("Error: Invalid number: "), std::string::npos);
}

TEST_F(CliTest, AddPoints) {
    EXPECT_EQ(Invoke({"add", G_X, G_Y, G2_X, G2_Y}).out, PointText(G3_X, G3_Y));
    EXPECT_EQ(Invoke({"add", G_X, G_Y, G_X, NEG_G_Y}).out, "(Infinity)\n");
    EXPECT_EQ(Invoke({"add", G_X, G_Y, G_X, G_Y}).out, PointText(G2_X, G2_Y));
}

// ============================================================================
// Options and Usage
// ============================================================================

TEST_F(CliTest, HelpAndVersion) {
    auto help = Invoke({"--help"});
    EXPECT_EQ(help.rc, EXIT_OK);
    EXPECT_NE(help.out.find("Usage: secpcore-cli"), std::string::npos);

    auto version = Invoke({"--version"});
    EXPECT_EQ(version.rc, EXIT_OK);
    EXPECT_NE(version.out.find(std::string("version ") + VERSION), std::string::npos);
}

TEST_F(CliTest, NoCommand) {
    auto result = Invoke({});
    EXPECT_EQ(result.rc, EXIT_USAGE);
    EXPECT_NE(result.err.find("No command specified"), std::string::npos);
}

TEST_F(CliTest, UnknownCommand) {
    auto result = Invoke({"sign", "1"});
    EXPECT_EQ(result.rc, EXIT_USAGE);
    EXPECT_NE(result.err.find("Unknown command 'sign'"), std::string::npos);
}

TEST_F(CliTest, InvalidOptionIsParseError) {
    auto result = Invoke({"--bad key", "sample"});
    EXPECT_EQ(result.rc, EXIT_USAGE);
    EXPECT_TRUE(result.out.empty());
    EXPECT_NE(result.err.find("Invalid option: '--bad key'"), std::string::npos);
}

TEST_F(CliTest, BadConfigFileReportsLine) {
    std::string conf = TempPath();
    {
        std::ofstream file(conf);
        file << "loglevel=debug\nbad key=1\n";
    }

    auto result = Invoke({"--conf=" + conf, "sample"});
    EXPECT_EQ(result.rc, EXIT_USAGE);
    EXPECT_NE(result.err.find(conf + ":2"), std::string::npos);
}

TEST_F(CliTest, LogFileReceivesDebugOutput) {
    std::string log = TempPath();

    auto result = Invoke({"--loglevel=debug", "--logfile=" + log, "mul", "2"});
    EXPECT_EQ(result.rc, EXIT_OK);

    std::string contents = ReadFile(log);
    EXPECT_NE(contents.find("[DEBUG] [cli] "), std::string::npos);
    EXPECT_NE(contents.find("Multiplying G by 2\n"), std::string::npos);
    EXPECT_NE(contents.find("Completed: scalar multiplication in "), std::string::npos);
}

TEST_F(CliTest, UnopenableLogFile) {
    auto result = Invoke({"--logfile=/nonexistent-dir/secpcore.log", "sample"});
    EXPECT_EQ(result.rc, EXIT_USAGE);
    EXPECT_TRUE(result.out.empty());
    EXPECT_NE(result.err.find("Cannot open log file"), std::string::npos);
}

} // namespace test
} // namespace cli
} // namespace secpcore
