#include <gtest/gtest.h>
#include <params/params.hpp>
#include <core/errors.hpp>

// ── Names ───────────────────────────────────────────────────

TEST(ParamName, ValidNames) {
    for (const char* name : {"A", "_", "_x", "abc_123", "INPUT_0", "lowerCase", "X1_Y2"}) {
        EXPECT_TRUE(is_valid_param_name(name)) << name;
    }
}

TEST(ParamName, InvalidNames) {
    for (const char* name : {"", "1abc", "a-b", "a b", "a.b", "$HOME", "a=b", "x\n"}) {
        EXPECT_FALSE(is_valid_param_name(name)) << name;
    }
}

TEST(ParamName, EnvParamRejectsBadName) {
    try {
        EnvParam param("1X", std::string("value"));
        FAIL() << "expected NameValidationError";
    } catch (const NameValidationError& e) {
        EXPECT_STREQ(e.what(), "Invalid Environment variable: 1X");
        EXPECT_EQ(e.name(), "1X");
    }
}

TEST(ParamName, FileParamRejectsBadName) {
    try {
        FileParam param(ParamRole::Output, "bad-name");
        FAIL() << "expected NameValidationError";
    } catch (const NameValidationError& e) {
        EXPECT_STREQ(e.what(), "Invalid Output parameter: bad-name");
    }
    EXPECT_THROW(FileParam(ParamRole::Input, ""), NameValidationError);
}

TEST(ParamName, ErrorsShareBase) {
    EXPECT_THROW(EnvParam("no spaces"), MinsubError);
}

// ── EnvParam / FileParam ────────────────────────────────────

TEST(EnvParam, ValueIsOptional) {
    EnvParam bare("VAR");
    EXPECT_EQ(bare.name, "VAR");
    EXPECT_FALSE(bare.value.has_value());

    EnvParam set("VAR", std::string("yeppers peppers"));
    EXPECT_EQ(set.value, "yeppers peppers");
}

TEST(FileParam, DeclaredOnly) {
    FileParam param(ParamRole::Input, "REF");
    EXPECT_EQ(param.role, ParamRole::Input);
    EXPECT_FALSE(param.value.has_value());
    EXPECT_FALSE(param.docker_path.has_value());
    EXPECT_FALSE(param.uri.has_value());
    EXPECT_FALSE(param.recursive);
}

TEST(FileParam, RoleLabels) {
    EXPECT_STREQ(param_type_label(ParamRole::Input), "Input parameter");
    EXPECT_STREQ(param_type_label(ParamRole::Output), "Output parameter");
}

// ── split_pair ──────────────────────────────────────────────

TEST(SplitPair, SplitsOnFirstSeparator) {
    auto [name, value] = split_pair("a=b=c", '=', 1);
    EXPECT_EQ(name, "a");
    EXPECT_EQ(value, "b=c");
}

TEST(SplitPair, MissingValue) {
    auto [name, value] = split_pair("key", '=', 1);
    EXPECT_EQ(name, "key");
    EXPECT_FALSE(value.has_value());
}

TEST(SplitPair, MissingName) {
    auto [name, value] = split_pair("gs://bucket/file.txt", '=', 0);
    EXPECT_FALSE(name.has_value());
    EXPECT_EQ(value, "gs://bucket/file.txt");
}

TEST(SplitPair, EmptySides) {
    auto [name, value] = split_pair("NAME=", '=', 0);
    EXPECT_EQ(name, "NAME");
    EXPECT_EQ(value, "");

    auto [name2, value2] = split_pair("=x", '=', 1);
    EXPECT_EQ(name2, "");
    EXPECT_EQ(value2, "x");
}

TEST(SplitPair, BadNullableIndex) {
    EXPECT_THROW(split_pair("a=b", '=', 2), std::invalid_argument);
}

// ── parse_env_args ──────────────────────────────────────────

TEST(ParseEnvArgs, KeepsOrderAndDropsRepeats) {
    auto envs = parse_env_args({"A='this is my string'", "VAR2=yeppers peppers", "B",
                                "A='this is my string'"});
    ASSERT_EQ(envs.size(), 3u);
    EXPECT_EQ(envs[0].name, "A");
    EXPECT_EQ(envs[0].value, "'this is my string'");
    EXPECT_EQ(envs[1].name, "VAR2");
    EXPECT_EQ(envs[2].name, "B");
    EXPECT_FALSE(envs[2].value.has_value());
}

TEST(ParseEnvArgs, ConflictingValuesAreKept) {
    // Collision detection happens at the JobParameterSet level.
    auto envs = parse_env_args({"A=1", "A=2"});
    EXPECT_EQ(envs.size(), 2u);
}

TEST(ParseEnvArgs, NameRequired) {
    EXPECT_THROW(parse_env_args({"=value"}), NameValidationError);
    EXPECT_THROW(parse_env_args({"9LIVES=cat"}), NameValidationError);
}
