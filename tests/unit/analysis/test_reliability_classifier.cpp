//
// Created by gregorian on 13/03/2026.
//

#include <gtest/gtest.h>
#include "cilens/analysis/reliability_classifier.h"

using namespace cilens::analysis;
using namespace cilens::core;

class ReliabilityClassifierTest : public ::testing::Test {
protected:
    static Job make_job(const std::string& id, const std::string& name, const JobStatus status, const bool retried) {
        Job job;
        job.id = id;
        job.name = name;
        job.stage = "test";
        job.duration_seconds = 1.0;
        job.status = status;
        job.retried = retried;
        return job;
    }

    static Pipeline make_pipeline(const std::string& id, std::vector<Job> jobs) {
        Pipeline pipeline;
        pipeline.id = id;
        pipeline.status = PipelineStatus::SUCCESS;
        pipeline.stages = {"test"};
        pipeline.jobs = std::move(jobs);
        return pipeline;
    }

    static std::vector<const Job*> pointers(const std::vector<Job>& jobs) {
        std::vector<const Job*> result;
        for (const auto& job : jobs) {
            result.push_back(&job);
        }
        return result;
    }
};

TEST_F(ReliabilityClassifierTest, RetriedThenSucceededIsFlaky) {
    const std::vector<Job> records = {
        make_job("1", "unit", JobStatus::FAILED, true),
        make_job("2", "unit", JobStatus::SUCCESS, false)
    };

    EXPECT_EQ(ReliabilityClassifier::classify(pointers(records)), ExecutionOutcome::FLAKY);
}

TEST_F(ReliabilityClassifierTest, RetriedThenFailedIsFailed) {
    const std::vector<Job> records = {
        make_job("1", "unit", JobStatus::FAILED, true),
        make_job("2", "unit", JobStatus::FAILED, false)
    };

    EXPECT_EQ(ReliabilityClassifier::classify(pointers(records)), ExecutionOutcome::FAILED);
}

TEST_F(ReliabilityClassifierTest, SingleSuccessIsSuccess) {
    const std::vector<Job> records = {make_job("1", "unit", JobStatus::SUCCESS, false)};

    EXPECT_EQ(ReliabilityClassifier::classify(pointers(records)), ExecutionOutcome::SUCCESS);
}

TEST_F(ReliabilityClassifierTest, SingleFailureIsFailed) {
    const std::vector<Job> records = {make_job("1", "unit", JobStatus::FAILED, false)};

    EXPECT_EQ(ReliabilityClassifier::classify(pointers(records)), ExecutionOutcome::FAILED);
}

TEST_F(ReliabilityClassifierTest, NoFinalRecordIsFailed) {
    const std::vector<Job> records = {
        make_job("1", "unit", JobStatus::SUCCESS, true),
        make_job("2", "unit", JobStatus::FAILED, true)
    };

    EXPECT_EQ(ReliabilityClassifier::classify(pointers(records)), ExecutionOutcome::FAILED);
}

TEST_F(ReliabilityClassifierTest, CanceledFinalIsFailed) {
    const std::vector<Job> records = {make_job("1", "unit", JobStatus::CANCELED, false)};

    EXPECT_EQ(ReliabilityClassifier::classify(pointers(records)), ExecutionOutcome::FAILED);
}

TEST_F(ReliabilityClassifierTest, AggregatesAcrossPipelines) {
    const std::vector<Pipeline> pipelines = {
        make_pipeline("p1", {
            make_job("j1", "unit", JobStatus::FAILED, true),
            make_job("j2", "unit", JobStatus::FAILED, true),
            make_job("j3", "unit", JobStatus::SUCCESS, false),
            make_job("j4", "lint", JobStatus::SUCCESS, false)
        }),
        make_pipeline("p2", {
            make_job("j5", "unit", JobStatus::FAILED, false),
            make_job("j6", "lint", JobStatus::SUCCESS, false)
        }),
        make_pipeline("p3", {
            make_job("j7", "unit", JobStatus::SUCCESS, false),
            make_job("j8", "lint", JobStatus::SUCCESS, false)
        })
    };
    const std::vector<const Pipeline*> refs = {&pipelines[0], &pipelines[1], &pipelines[2]};

    const auto reliability = ReliabilityClassifier::calculate(refs);

    ASSERT_EQ(reliability.count("unit"), 1u);
    const auto& unit = reliability.at("unit");
    EXPECT_EQ(unit.total_executions, 5u);
    EXPECT_EQ(unit.flaky_retries.count, 2u);
    EXPECT_EQ(unit.flaky_retries.links, (std::vector<std::string>{"j1", "j2"}));
    EXPECT_EQ(unit.failed_executions.count, 1u);
    EXPECT_EQ(unit.failed_executions.links, (std::vector<std::string>{"j5"}));
    EXPECT_DOUBLE_EQ(unit.flakiness_rate, 40.0);
    EXPECT_DOUBLE_EQ(unit.failure_rate, 20.0);

    const auto& lint = reliability.at("lint");
    EXPECT_EQ(lint.total_executions, 3u);
    EXPECT_EQ(lint.flaky_retries.count, 0u);
    EXPECT_EQ(lint.failed_executions.count, 0u);
    EXPECT_DOUBLE_EQ(lint.flakiness_rate, 0.0);
    EXPECT_DOUBLE_EQ(lint.failure_rate, 0.0);
}

TEST_F(ReliabilityClassifierTest, FailedGroupWithoutFinalRecordHasNoLink) {
    const std::vector<Pipeline> pipelines = {
        make_pipeline("p1", {make_job("j1", "deploy", JobStatus::FAILED, true)})
    };

    const auto reliability = ReliabilityClassifier::calculate({&pipelines[0]});
    const auto& deploy = reliability.at("deploy");

    EXPECT_EQ(deploy.failed_executions.count, 1u);
    EXPECT_TRUE(deploy.failed_executions.links.empty());
    EXPECT_DOUBLE_EQ(deploy.failure_rate, 100.0);
}

TEST_F(ReliabilityClassifierTest, FlakyAndFailedAreExclusive) {
    const std::vector<Pipeline> pipelines = {
        make_pipeline("p1", {
            make_job("j1", "e2e", JobStatus::FAILED, true),
            make_job("j2", "e2e", JobStatus::SUCCESS, false)
        })
    };

    const auto reliability = ReliabilityClassifier::calculate({&pipelines[0]});
    const auto& e2e = reliability.at("e2e");

    EXPECT_EQ(e2e.flaky_retries.count, 1u);
    EXPECT_EQ(e2e.failed_executions.count, 0u);
}

TEST_F(ReliabilityClassifierTest, EmptyInput) {
    EXPECT_TRUE(ReliabilityClassifier::calculate({}).empty());
}

TEST_F(ReliabilityClassifierTest, RateHandlesZeroTotal) {
    EXPECT_DOUBLE_EQ(ReliabilityClassifier::calculate_rate(0, 0), 0.0);
    EXPECT_DOUBLE_EQ(ReliabilityClassifier::calculate_rate(1, 4), 25.0);
}

TEST_F(ReliabilityClassifierTest, OutcomeNames) {
    EXPECT_EQ(to_string(ExecutionOutcome::SUCCESS), "success");
    EXPECT_EQ(to_string(ExecutionOutcome::FLAKY), "flaky");
    EXPECT_EQ(to_string(ExecutionOutcome::FAILED), "failed");
}
