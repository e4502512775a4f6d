#include <gtest/gtest.h>
#include <params/job_params.hpp>
#include <core/errors.hpp>

static std::vector<std::string> collision_names(const std::vector<std::string>& envs,
                                                const std::vector<std::string>& inputs,
                                                const std::vector<std::string>& inputs_recursive,
                                                const std::vector<std::string>& outputs,
                                                const std::vector<std::string>& outputs_recursive) {
    try {
        args_to_job_params(envs, inputs, inputs_recursive, outputs, outputs_recursive);
    } catch (const CollisionError& e) {
        return e.duplicates();
    }
    ADD_FAILURE() << "expected CollisionError";
    return {};
}

// ── Auto naming ─────────────────────────────────────────────

TEST(ParamSetBuilder, AutoNamesInputsInOrder) {
    auto job = args_to_job_params({}, {"gs://b/one.txt", "gs://b/two.txt", "gs://b/three.txt"},
                                  {}, {}, {});
    ASSERT_EQ(job.inputs().size(), 3u);
    EXPECT_EQ(job.inputs()[0].name, "INPUT_0");
    EXPECT_EQ(job.inputs()[1].name, "INPUT_1");
    EXPECT_EQ(job.inputs()[2].name, "INPUT_2");
    EXPECT_EQ(job.inputs()[2].uri->basename, "three.txt");
}

TEST(ParamSetBuilder, AutoNameCountersPerRole) {
    auto job = args_to_job_params({}, {"gs://b/in.txt"}, {"gs://b/dir/"},
                                  {"gs://b/out.txt"}, {"gs://b/outdir/"});
    EXPECT_EQ(job.inputs()[0].name, "INPUT_0");
    EXPECT_EQ(job.recursive_inputs()[0].name, "INPUT_1");
    EXPECT_EQ(job.outputs()[0].name, "OUTPUT_0");
    EXPECT_EQ(job.recursive_outputs()[0].name, "OUTPUT_1");
}

TEST(ParamSetBuilder, EmptyNameIsAutoNamed) {
    auto job = args_to_job_params({}, {"=gs://b/x.txt"}, {}, {}, {});
    EXPECT_EQ(job.inputs()[0].name, "INPUT_0");
}

TEST(ParamSetBuilder, BuildersDoNotShareCounters) {
    ParamSetBuilder first;
    ParamSetBuilder second;
    auto a = first.build({}, {"gs://b/a.txt", "gs://b/b.txt"}, {}, {}, {});
    auto b = second.build({}, {"gs://b/c.txt"}, {}, {}, {});
    EXPECT_EQ(a.inputs()[1].name, "INPUT_1");
    EXPECT_EQ(b.inputs()[0].name, "INPUT_0");
}

TEST(ParamSetBuilder, GetVariableName) {
    ParamSetBuilder builder;
    EXPECT_EQ(builder.get_variable_name(ParamRole::Output, ""), "OUTPUT_0");
    EXPECT_EQ(builder.get_variable_name(ParamRole::Output, "NAMED"), "NAMED");
    EXPECT_EQ(builder.get_variable_name(ParamRole::Output, ""), "OUTPUT_1");
    EXPECT_EQ(builder.get_variable_name(ParamRole::Input, ""), "INPUT_0");
}

// ── Names ───────────────────────────────────────────────────

TEST(ParamSetBuilder, ValidNamesRoundTrip) {
    std::vector<std::string> names = {"A", "_private", "mixedCase_9", "Z_"};
    std::vector<std::string> envs, inputs;
    for (const auto& n : names) {
        envs.push_back(n + "=v");
        inputs.push_back("IN" + n + "=gs://b/" + n + ".txt");
    }
    auto job = args_to_job_params(envs, inputs, {}, {}, {});
    for (size_t i = 0; i < names.size(); i++) {
        EXPECT_EQ(job.envs()[i].name, names[i]);
        EXPECT_EQ(job.inputs()[i].name, "IN" + names[i]);
    }
}

TEST(ParamSetBuilder, InvalidNamesRejectedInEveryClass) {
    EXPECT_THROW(args_to_job_params({"1A=x"}, {}, {}, {}, {}), NameValidationError);
    EXPECT_THROW(args_to_job_params({}, {"a-b=gs://b/x.txt"}, {}, {}, {}), NameValidationError);
    EXPECT_THROW(args_to_job_params({}, {}, {"a.b=gs://b/d/"}, {}, {}), NameValidationError);
    EXPECT_THROW(args_to_job_params({}, {}, {}, {"a b=gs://b/x.txt"}, {}), NameValidationError);
    EXPECT_THROW(args_to_job_params({}, {}, {}, {}, {"$X=gs://b/d/"}), NameValidationError);
}

TEST(ParamSetBuilder, BadNameReportedBeforeBadUri) {
    EXPECT_THROW(args_to_job_params({}, {"1BAD=s3://b/x.txt"}, {}, {}, {}), NameValidationError);
}

TEST(ParamSetBuilder, UnnamedValueWithEqualsIsAName) {
    // Everything before the first '=' is the name, so this needs an explicit one.
    EXPECT_THROW(args_to_job_params({}, {"gs://b/a=b.txt"}, {}, {}, {}), NameValidationError);
    auto job = args_to_job_params({}, {"F=gs://b/a=b.txt"}, {}, {}, {});
    EXPECT_EQ(job.inputs()[0].uri->basename, "a=b.txt");
}

// ── Values ──────────────────────────────────────────────────

TEST(ParamSetBuilder, FileParamFields) {
    auto job = args_to_job_params({}, {"F1=gs://bucket/myfile.txt"}, {}, {}, {});
    const auto& f = job.inputs()[0];
    EXPECT_EQ(f.role, ParamRole::Input);
    EXPECT_EQ(f.value, "gs://bucket/myfile.txt");
    EXPECT_EQ(f.docker_path, "gs/bucket/myfile.txt");
    EXPECT_EQ(f.uri->str(), "gs://bucket/myfile.txt");
    EXPECT_FALSE(f.recursive);
}

TEST(ParamSetBuilder, RecursiveOutputCoerced) {
    auto job = args_to_job_params({}, {}, {}, {}, {"R=gs://b/dir"});
    const auto& r = job.recursive_outputs()[0];
    EXPECT_EQ(r.role, ParamRole::Output);
    EXPECT_TRUE(r.recursive);
    EXPECT_EQ(r.value, "gs://b/dir");
    EXPECT_EQ(r.uri->str(), "gs://b/dir/");
    EXPECT_EQ(r.docker_path, "gs/b/dir/");
}

TEST(ParamSetBuilder, EmptyValueDeclaresParameter) {
    auto job = args_to_job_params({}, {"REF="}, {}, {"RESULT="}, {});
    const auto& in = job.inputs()[0];
    EXPECT_EQ(in.name, "REF");
    EXPECT_FALSE(in.value.has_value());
    EXPECT_FALSE(in.docker_path.has_value());
    EXPECT_FALSE(in.uri.has_value());
    EXPECT_EQ(job.outputs()[0].name, "RESULT");
}

TEST(ParamSetBuilder, UriErrorsPropagate) {
    try {
        args_to_job_params({}, {"gs://bucket/a[0-9].txt"}, {}, {}, {});
        FAIL() << "expected UriValidationError";
    } catch (const UriValidationError& e) {
        EXPECT_NE(std::string(e.what()).find("character ranges"), std::string::npos);
    }
    EXPECT_THROW(args_to_job_params({}, {"s3://b/x.txt"}, {}, {}, {}), UriValidationError);
    EXPECT_THROW(args_to_job_params({}, {}, {}, {"gs://b/dir/"}, {}), UriValidationError);
}

TEST(ParamSetBuilder, LocalProviderOptIn) {
    ParamSetBuilder builder(UriNormalizer({FileProvider::Google, FileProvider::Local}));
    auto job = builder.build({}, {"L=/tmp/data/file.txt"}, {}, {}, {});
    EXPECT_EQ(job.inputs()[0].docker_path, "file/tmp/data/file.txt");
}

// ── Dedup and collisions ────────────────────────────────────

TEST(ParamSetBuilder, ExactRepeatsCollapse) {
    auto job = args_to_job_params({"A=1", "A=1"}, {"F=gs://b/x.txt", "F=gs://b/x.txt"},
                                  {}, {}, {});
    EXPECT_EQ(job.envs().size(), 1u);
    EXPECT_EQ(job.inputs().size(), 1u);
}

TEST(ParamSetBuilder, CollisionAcrossClasses) {
    EXPECT_EQ(collision_names({"F1=x"}, {"F1=gs://b/x.txt"}, {}, {}, {}),
              std::vector<std::string>{"F1"});
    EXPECT_EQ(collision_names({}, {"D=gs://b/x.txt"}, {}, {}, {"D=gs://b/out/"}),
              std::vector<std::string>{"D"});
    EXPECT_EQ(collision_names({}, {}, {"R=gs://b/in/"}, {"R=gs://b/o.txt"}, {}),
              std::vector<std::string>{"R"});
}

TEST(ParamSetBuilder, CollisionWithinClass) {
    EXPECT_EQ(collision_names({"A=1", "A=2"}, {}, {}, {}, {}),
              std::vector<std::string>{"A"});
    EXPECT_EQ(collision_names({}, {"F=gs://b/x.txt", "F=gs://b/y.txt"}, {}, {}, {}),
              std::vector<std::string>{"F"});
}

TEST(ParamSetBuilder, CollisionReportsEveryName) {
    try {
        args_to_job_params({"A=1", "B=2"}, {"A=gs://b/a.txt"}, {}, {"B=gs://b/b.txt"}, {});
        FAIL() << "expected CollisionError";
    } catch (const CollisionError& e) {
        EXPECT_EQ(e.duplicates(), (std::vector<std::string>{"A", "B"}));
        std::string msg = e.what();
        EXPECT_NE(msg.find("A"), std::string::npos);
        EXPECT_NE(msg.find("B"), std::string::npos);
        EXPECT_NE(msg.find("duplicate names"), std::string::npos);
    }
}

TEST(ParamSetBuilder, AutoNameCanCollide) {
    EXPECT_EQ(collision_names({}, {"INPUT_0=gs://b/a.txt", "gs://b/b.txt"}, {}, {}, {}),
              std::vector<std::string>{"INPUT_0"});
}

TEST(JobParameterSet, DirectConstructionChecksNames) {
    std::vector<EnvParam> envs = {EnvParam("X", std::string("1"))};
    std::vector<FileParam> outputs = {FileParam(ParamRole::Output, "X")};
    EXPECT_THROW(JobParameterSet(envs, {}, {}, outputs, {}), CollisionError);
}

TEST(JobParameterSet, NamesInClassOrder) {
    auto job = args_to_job_params({"E=1"}, {"I=gs://b/i.txt"}, {"RI=gs://b/ri/"},
                                  {"O=gs://b/o.txt"}, {"RO=gs://b/ro/"});
    EXPECT_EQ(job.names(), (std::vector<std::string>{"E", "I", "RI", "O", "RO"}));
}

TEST(FindDuplicateNames, EachNameOnce) {
    EXPECT_EQ(find_duplicate_names({"a", "b", "a", "a", "c", "b"}),
              (std::vector<std::string>{"a", "b"}));
    EXPECT_TRUE(find_duplicate_names({"a", "b", "c"}).empty());
}
