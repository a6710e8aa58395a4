#include <doctest/doctest.h>

#include <puppet/control/checkpoint.hpp>

using namespace puppet;

namespace {
    struct CountingRecorder : Recorder {
        int updates = 0;
        int rollbacks = 0;
        int saves = 0;
        bool fail_rollback = false;

        dp::Result<Ack> update_checkpoint() override {
            ++updates;
            return ok();
        }
        dp::Result<Ack> rollback_to_checkpoint() override {
            if (fail_rollback) {
                return fail<Ack>(ErrorKind::Collaborator, "nothing to restore");
            }
            ++rollbacks;
            return ok();
        }
        dp::Result<Ack> save_data() override {
            ++saves;
            return ok();
        }
    };

    GoalStatus satisfied(dp::u32 n) {
        GoalStatus status;
        for (dp::u32 i = 0; i < n; ++i) {
            status.satisfied.push_back(i);
        }
        status.unsatisfied.push_back(n);
        return status;
    }
} // namespace

TEST_CASE("checkpoint: periodic checkpoint every N applied ticks") {
    CountingRecorder recorder;
    Config cfg;
    cfg.checkpoint_every_ticks = 3;
    control::CheckpointCoordinator checkpoints(&recorder, cfg);

    for (int i = 0; i < 7; ++i) {
        REQUIRE(checkpoints.on_tick().is_ok());
    }
    CHECK(recorder.updates == 2);
    CHECK(checkpoints.checkpoints() == 2);
    CHECK(checkpoints.ticks() == 1);
}

TEST_CASE("checkpoint: periodic checkpoints can be disabled") {
    CountingRecorder recorder;
    Config cfg;
    cfg.auto_checkpoint = false;
    cfg.checkpoint_every_ticks = 1;
    control::CheckpointCoordinator checkpoints(&recorder, cfg);

    for (int i = 0; i < 50; ++i) {
        CHECK(checkpoints.on_tick().is_ok());
    }
    CHECK(recorder.updates == 0);

    REQUIRE(checkpoints.manual().is_ok());
    CHECK(recorder.updates == 1);
}

TEST_CASE("checkpoint: goal progress checkpoints only on a strict increase") {
    CountingRecorder recorder;
    Config cfg;
    control::CheckpointCoordinator checkpoints(&recorder, cfg);

    for (dp::u32 n : {0u, 1u, 1u, 2u, 1u, 2u, 2u}) {
        REQUIRE(checkpoints.on_goal_status(satisfied(n)).is_ok());
    }
    CHECK(recorder.updates == 3);

    // A new episode starts counting from zero again.
    checkpoints.reset();
    CHECK(checkpoints.on_goal_status(satisfied(1)).is_ok());
    CHECK(recorder.updates == 4);
}

TEST_CASE("checkpoint: rollback and finalize reach the recorder") {
    CountingRecorder recorder;
    Config cfg;
    control::CheckpointCoordinator checkpoints(&recorder, cfg);

    REQUIRE(checkpoints.rollback().is_ok());
    CHECK(recorder.rollbacks == 1);
    CHECK(checkpoints.rollbacks() == 1);

    recorder.fail_rollback = true;
    auto failed = checkpoints.rollback();
    REQUIRE(failed.is_err());
    CHECK(kind_of(failed.error()) == ErrorKind::Collaborator);
    CHECK(checkpoints.rollbacks() == 1);

    REQUIRE(checkpoints.finalize().is_ok());
    CHECK(recorder.saves == 1);
}

TEST_CASE("checkpoint: every request is a no-op without a recorder") {
    Config cfg;
    cfg.checkpoint_every_ticks = 1;
    control::CheckpointCoordinator checkpoints(nullptr, cfg);

    CHECK_FALSE(checkpoints.recording());
    CHECK(checkpoints.on_tick().is_ok());
    CHECK(checkpoints.manual().is_ok());
    CHECK(checkpoints.on_goal_status(satisfied(3)).is_ok());
    CHECK(checkpoints.rollback().is_ok());
    CHECK(checkpoints.finalize().is_ok());
    CHECK(checkpoints.checkpoints() == 0);
    CHECK(checkpoints.rollbacks() == 0);
}
