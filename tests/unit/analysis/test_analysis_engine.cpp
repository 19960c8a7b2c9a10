//
// Created by gregorian on 15/03/2026.
//

#include <gtest/gtest.h>
#include "cilens/analysis/analysis_engine.h"

using namespace cilens::analysis;
using namespace cilens::core;

class InsightsEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        options = InsightsEngine::Options{};
        pipelines.clear();
    }

    InsightsEngine::Options options;
    std::vector<Pipeline> pipelines;

    void add_pipeline(const std::string& id, const std::vector<std::string>& job_names,
                      const PipelineStatus status = PipelineStatus::SUCCESS) {
        Pipeline pipeline;
        pipeline.id = id;
        pipeline.ref = "main";
        pipeline.source = "push";
        pipeline.status = status;
        pipeline.duration_seconds = 60;
        pipeline.stages = {"build", "test", "deploy"};

        int n = 0;
        for (const auto& name : job_names) {
            Job job;
            job.id = id + "-" + std::to_string(n++);
            job.name = name;
            job.stage = name == "compile" ? "build" : (name == "deploy-prod" ? "deploy" : "test");
            job.duration_seconds = 10;
            job.status = JobStatus::SUCCESS;
            pipeline.jobs.push_back(job);
        }
        pipelines.push_back(pipeline);
    }

    // 8 pipelines of type A, 2 of type B.
    void create_two_types() {
        for (int i = 0; i < 8; ++i) {
            add_pipeline("a" + std::to_string(i), {"compile", "unit-test"});
        }
        for (int i = 0; i < 2; ++i) {
            add_pipeline("b" + std::to_string(i), {"compile", "deploy-prod"});
        }
    }
};

TEST_F(InsightsEngineTest, RejectsNegativeThreshold) {
    create_two_types();
    options.min_type_percentage = -1;

    auto result = InsightsEngine::analyze(pipelines, options);

    ASSERT_TRUE(result.is_failure());
    EXPECT_EQ(result.error().code, ErrorCode::INVALID_ARGUMENT);
}

TEST_F(InsightsEngineTest, RejectsThresholdAboveHundred) {
    create_two_types();
    options.min_type_percentage = 101;

    auto result = InsightsEngine::analyze(pipelines, options);

    ASSERT_TRUE(result.is_failure());
    EXPECT_EQ(result.error().code, ErrorCode::INVALID_ARGUMENT);
}

TEST_F(InsightsEngineTest, EmptyInput) {
    auto result = InsightsEngine::analyze(pipelines, options);

    ASSERT_TRUE(result.is_success());
    EXPECT_TRUE(result.value().empty());
}

TEST_F(InsightsEngineTest, KeepsTypesAboveThreshold) {
    create_two_types();
    options.min_type_percentage = 20;

    auto result = InsightsEngine::analyze(pipelines, options);

    ASSERT_TRUE(result.is_success());
    const auto& types = result.value();
    ASSERT_EQ(types.size(), 2u);

    EXPECT_EQ(types[0].job_names, (std::vector<std::string>{"compile", "unit-test"}));
    EXPECT_EQ(types[0].label, "Development");
    EXPECT_EQ(types[0].ids.size(), 8u);
    EXPECT_DOUBLE_EQ(types[0].metrics.percentage, 80.0);
    EXPECT_EQ(types[0].metrics.total_pipelines, 8u);

    EXPECT_EQ(types[1].job_names, (std::vector<std::string>{"compile", "deploy-prod"}));
    EXPECT_EQ(types[1].label, "Production");
    EXPECT_DOUBLE_EQ(types[1].metrics.percentage, 20.0);
}

TEST_F(InsightsEngineTest, DropsTypesBelowThreshold) {
    create_two_types();
    options.min_type_percentage = 25;

    auto result = InsightsEngine::analyze(pipelines, options);

    ASSERT_TRUE(result.is_success());
    ASSERT_EQ(result.value().size(), 1u);
    EXPECT_EQ(result.value()[0].ids.size(), 8u);
}

TEST_F(InsightsEngineTest, CharacteristicsCopiedFromCluster) {
    add_pipeline("1", {"compile", "unit-test"});

    auto result = InsightsEngine::analyze(pipelines, options);

    ASSERT_TRUE(result.is_success());
    ASSERT_EQ(result.value().size(), 1u);
    const auto& type = result.value()[0];
    EXPECT_EQ(type.stages, (std::vector<std::string>{"build", "test"}));
    EXPECT_EQ(type.ref_patterns, (std::vector<std::string>{"main"}));
    EXPECT_EQ(type.sources, (std::vector<std::string>{"push"}));
    EXPECT_EQ(type.ids, (std::vector<std::string>{"1"}));
}

TEST_F(InsightsEngineTest, IdenticalInputGivesIdenticalOutput) {
    create_two_types();
    add_pipeline("f1", {"compile", "unit-test"}, PipelineStatus::FAILED);

    auto first = InsightsEngine::analyze(pipelines, options);
    auto second = InsightsEngine::analyze(pipelines, options);

    ASSERT_TRUE(first.is_success());
    ASSERT_TRUE(second.is_success());
    ASSERT_EQ(first.value().size(), second.value().size());

    for (std::size_t i = 0; i < first.value().size(); ++i) {
        const auto& a = first.value()[i].metrics;
        const auto& b = second.value()[i].metrics;
        EXPECT_EQ(first.value()[i].ids, second.value()[i].ids);
        EXPECT_DOUBLE_EQ(a.success_rate, b.success_rate);
        EXPECT_DOUBLE_EQ(a.time_to_feedback_p95, b.time_to_feedback_p95);
        ASSERT_EQ(a.jobs.size(), b.jobs.size());
        for (std::size_t j = 0; j < a.jobs.size(); ++j) {
            EXPECT_EQ(a.jobs[j].name, b.jobs[j].name);
            EXPECT_DOUBLE_EQ(a.jobs[j].time_to_feedback_p95, b.jobs[j].time_to_feedback_p95);
        }
    }
}

TEST_F(InsightsEngineTest, CollectInsightsWrapsTypes) {
    create_two_types();

    auto result = InsightsEngine::collect_insights("GitLab", "group/app", pipelines, options);

    ASSERT_TRUE(result.is_success());
    const auto& insights = result.value();
    EXPECT_EQ(insights.provider, "GitLab");
    EXPECT_EQ(insights.project, "group/app");
    EXPECT_EQ(insights.total_pipelines, 10u);
    EXPECT_EQ(insights.total_pipeline_types, 2u);
    EXPECT_EQ(insights.pipeline_types.size(), 2u);
    EXPECT_NE(insights.collected_at.time_since_epoch().count(), 0);
}

TEST_F(InsightsEngineTest, CollectInsightsPropagatesError) {
    options.min_type_percentage = 150;

    auto result = InsightsEngine::collect_insights("GitLab", "group/app", pipelines, options);

    ASSERT_TRUE(result.is_failure());
    EXPECT_EQ(result.error().code, ErrorCode::INVALID_ARGUMENT);
}
