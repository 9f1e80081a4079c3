#include "core/token/rotation_engine.hpp"
#include "core/token/token_store.hpp"
#include "token_test_utils.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <thread>
#include <vector>

using namespace sessionguard::core;
using sessionguard::common::CallContext;
using sessionguard::common::Status;
using sessionguard::common::StatusCode;
using sessionguard::common::kSecondsPerDay;

class RotationEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        clock_ = std::make_shared<testutils::ManualClock>();
        store_ = std::make_shared<testutils::FaultInjectingTokenStore>();
        generator_ = std::make_shared<testutils::ScriptedTokenGenerator>();
        signer_ = std::make_shared<testutils::FakeAccessTokenSigner>();
        events_ = std::make_shared<testutils::RecordingSecurityEventSink>();
        engine_ = MakeEngine(RotationConfig{});
    }

    std::unique_ptr<RotationEngine> MakeEngine(RotationConfig config) {
        return std::make_unique<RotationEngine>(config, store_, generator_, clock_, signer_, events_);
    }

    IssuedToken Issue(const std::string& user_id = "u1", DeviceInfo device = DefaultDevice()) {
        IssueCommand command;
        command.user_id = user_id;
        command.tenant_id = "t1";
        command.device = std::move(device);
        auto issued = engine_->IssueInitial(command);
        EXPECT_TRUE(issued.IsOk()) << issued.GetStatus().Message();
        return issued.Value();
    }

    TokenResult<RotatedTokenPair> Rotate(const std::string& value, DeviceInfo device = DeviceInfo{}) {
        RotateCommand command;
        command.presented_value = value;
        command.device = std::move(device);
        return engine_->Rotate(command);
    }

    RefreshToken Load(const std::string& value) {
        auto found = store_->inner.FindByValue(value);
        EXPECT_TRUE(found.IsOk()) << found.GetStatus().Message();
        return found.Value();
    }

    static DeviceInfo DefaultDevice() {
        DeviceInfo device;
        device.ip = "10.0.0.1";
        device.user_agent = "Mozilla/5.0";
        device.device_fingerprint = "fp-laptop";
        device.device_name = "Laptop";
        return device;
    }

    std::shared_ptr<testutils::ManualClock> clock_;
    std::shared_ptr<testutils::FaultInjectingTokenStore> store_;
    std::shared_ptr<testutils::ScriptedTokenGenerator> generator_;
    std::shared_ptr<testutils::FakeAccessTokenSigner> signer_;
    std::shared_ptr<testutils::RecordingSecurityEventSink> events_;
    std::unique_ptr<RotationEngine> engine_;
};

// 登录签发: 新令牌族, 默认7天有效
TEST_F(RotationEngineTest, IssueInitialStartsNewFamily) {
    auto first = Issue();
    auto second = Issue();

    EXPECT_FALSE(first.value.empty());
    EXPECT_NE(first.token_family, second.token_family);
    EXPECT_EQ(first.expires_at, clock_->NowSeconds() + 7 * kSecondsPerDay);

    auto stored = Load(first.value);
    EXPECT_EQ(stored.user_id, "u1");
    EXPECT_EQ(stored.tenant_id, "t1");
    EXPECT_EQ(stored.token_family, first.token_family);
    EXPECT_EQ(stored.id, first.token_id);
    EXPECT_EQ(stored.device_name, "Laptop");
    EXPECT_TRUE(stored.IsActive(clock_->NowSeconds()));
}

TEST_F(RotationEngineTest, IssueInitialHonoursExplicitLifetime) {
    IssueCommand command;
    command.user_id = "u1";
    command.lifetime_days = 30;
    auto issued = engine_->IssueInitial(command);
    ASSERT_TRUE(issued.IsOk());
    EXPECT_EQ(issued.Value().expires_at, clock_->NowSeconds() + 30 * kSecondsPerDay);
}

TEST_F(RotationEngineTest, IssueInitialRejectsEmptyUser) {
    IssueCommand command;
    auto issued = engine_->IssueInitial(command);
    EXPECT_FALSE(issued.IsOk());
    EXPECT_EQ(issued.Error(), TokenErrorCode::kInvalidArgument);
    EXPECT_EQ(store_->inner.Size(), 0u);
}

// 正常轮换: 前驱被标记为 Rotated 并指向后继
TEST_F(RotationEngineTest, RotateLinksPredecessorToSuccessor) {
    auto issued = Issue();
    clock_->AdvanceDays(1);

    auto rotated = Rotate(issued.value);
    ASSERT_TRUE(rotated.IsOk()) << rotated.GetStatus().Message();
    const auto& pair = rotated.Value();

    auto predecessor = Load(issued.value);
    ASSERT_TRUE(predecessor.IsRevoked());
    EXPECT_EQ(predecessor.revocation->reason, RevocationReason::kRotated);
    EXPECT_EQ(predecessor.revocation->replaced_by_token, pair.refresh_token);
    EXPECT_EQ(predecessor.revocation->revoked_at, clock_->NowSeconds());

    auto successor = Load(pair.refresh_token);
    EXPECT_FALSE(successor.IsRevoked());
    EXPECT_EQ(successor.token_family, issued.token_family);
    EXPECT_EQ(pair.token_family, issued.token_family);
    EXPECT_EQ(pair.user_id, "u1");
    EXPECT_EQ(pair.tenant_id, "t1");
    EXPECT_EQ(pair.access_token, "access:u1:t1");
    // 后继沿用令牌族的有效期长度, 从轮换时刻起算
    EXPECT_EQ(pair.expires_at, clock_->NowSeconds() + 7 * kSecondsPerDay);
}

TEST_F(RotationEngineTest, RotateUnknownTokenIsInvalid) {
    Issue();
    const int inserts_before = store_->CallsOf("Insert");

    auto rotated = Rotate("no-such-token");
    EXPECT_EQ(rotated.Error(), TokenErrorCode::kInvalidToken);
    EXPECT_EQ(store_->CallsOf("Insert"), inserts_before);
    EXPECT_EQ(store_->CallsOf("UpdateRevocation"), 0);

    EXPECT_EQ(Rotate("").Error(), TokenErrorCode::kInvalidToken);
}

// T1 -> T2, 再次提交 T1 触发盗用检测, T2 随之失效
TEST_F(RotationEngineTest, ReusedTokenRevokesWholeFamily) {
    auto t1 = Issue();
    auto first = Rotate(t1.value);
    ASSERT_TRUE(first.IsOk());
    const std::string t2 = first.Value().refresh_token;

    auto replay = Rotate(t1.value, DeviceInfo{"203.0.113.9", "curl", "", ""});
    EXPECT_EQ(replay.Error(), TokenErrorCode::kTokenReuseDetected);

    auto t2_record = Load(t2);
    ASSERT_TRUE(t2_record.IsRevoked());
    EXPECT_EQ(t2_record.revocation->reason, RevocationReason::kTheftDetected);
    EXPECT_EQ(t2_record.revocation->revoked_by_ip, "203.0.113.9");
    // 已经是 Rotated 的 T1 不会被改写
    EXPECT_EQ(Load(t1.value).revocation->reason, RevocationReason::kRotated);

    auto again = Rotate(t2);
    EXPECT_EQ(again.Error(), TokenErrorCode::kTokenReuseDetected);

    ASSERT_EQ(events_->CountOf(SecurityEventType::kTokenReuseDetected), 2u);
    const auto first_event = events_->Events().front();
    EXPECT_EQ(first_event.severity, EventSeverity::kCritical);
    EXPECT_EQ(first_event.token_family, t1.token_family);
    EXPECT_EQ(first_event.user_id, "u1");
    EXPECT_EQ(first_event.revoked_count, 1u);
}

// 任意原因吊销的令牌再次出现都按盗用处理
TEST_F(RotationEngineTest, ReuseDetectionIgnoresOriginalRevocationReason) {
    auto issued = Issue();
    auto rotated = Rotate(issued.value);
    ASSERT_TRUE(rotated.IsOk());

    auto stray = Load(rotated.Value().refresh_token);
    stray.id = "manual-id";
    stray.value = "manually-revoked";
    Revocation manual;
    manual.revoked_at = clock_->NowSeconds();
    manual.reason = RevocationReason::kManualRevoke;
    stray.revocation = manual;
    ASSERT_TRUE(store_->inner.Insert(stray).IsOk());

    EXPECT_EQ(Rotate("manually-revoked").Error(), TokenErrorCode::kTokenReuseDetected);
    EXPECT_TRUE(Load(rotated.Value().refresh_token).IsRevoked());
}

// 重复提交不会产生额外副作用
TEST_F(RotationEngineTest, ReuseDetectionIsIdempotent) {
    auto issued = Issue();
    ASSERT_TRUE(Rotate(issued.value).IsOk());

    EXPECT_EQ(Rotate(issued.value).Error(), TokenErrorCode::kTokenReuseDetected);
    EXPECT_EQ(Rotate(issued.value).Error(), TokenErrorCode::kTokenReuseDetected);

    auto events = events_->Events();
    ASSERT_EQ(events.size(), 2u);
    EXPECT_EQ(events[0].revoked_count, 1u);
    EXPECT_EQ(events[1].revoked_count, 0u);
    EXPECT_EQ(store_->inner.Size(), 2u);
}

// 过期令牌: 良性失败, 不吊销也不写入
TEST_F(RotationEngineTest, ExpiredTokenFailsWithoutFamilyRevocation) {
    auto issued = Issue();
    auto sibling = Rotate(issued.value);
    ASSERT_TRUE(sibling.IsOk());
    const std::string current = sibling.Value().refresh_token;
    clock_->AdvanceDays(8);
    const int inserts_before = store_->CallsOf("Insert");
    const int updates_before = store_->CallsOf("UpdateRevocation");

    EXPECT_EQ(Rotate(current).Error(), TokenErrorCode::kTokenExpired);

    EXPECT_FALSE(Load(current).IsRevoked());
    EXPECT_EQ(store_->CallsOf("Insert"), inserts_before);
    EXPECT_EQ(store_->CallsOf("UpdateRevocation"), updates_before);
    EXPECT_EQ(events_->CountOf(SecurityEventType::kTokenExpired), 1u);
    EXPECT_EQ(events_->CountOf(SecurityEventType::kTokenReuseDetected), 0u);
}

TEST_F(RotationEngineTest, TokenExpiresExactlyAtExpiry) {
    auto issued = Issue();
    clock_->Set(issued.expires_at - 1);
    auto rotated = Rotate(issued.value);
    ASSERT_TRUE(rotated.IsOk());

    clock_->Set(rotated.Value().expires_at);
    EXPECT_EQ(Rotate(rotated.Value().refresh_token).Error(), TokenErrorCode::kTokenExpired);
}

TEST_F(RotationEngineTest, ExpiredEventCanBeSilenced) {
    RotationConfig config;
    config.report_expired = false;
    engine_ = MakeEngine(config);
    auto issued = Issue();
    clock_->AdvanceDays(8);

    EXPECT_EQ(Rotate(issued.value).Error(), TokenErrorCode::kTokenExpired);
    EXPECT_TRUE(events_->Events().empty());
}

// 同一令牌并发轮换, 只有一个调用成功
TEST_F(RotationEngineTest, ConcurrentRotationHasSingleWinner) {
    auto issued = Issue();
    constexpr int kThreads = 8;
    std::atomic<int> successes{0};
    std::atomic<int> reuse{0};
    std::atomic<int> other{0};
    std::atomic<bool> go{false};

    std::vector<std::thread> threads;
    for (int i = 0; i < kThreads; ++i) {
        threads.emplace_back([&]() {
            while (!go.load()) {
                std::this_thread::yield();
            }
            auto result = Rotate(issued.value);
            if (result.IsOk()) {
                ++successes;
            } else if (result.Error() == TokenErrorCode::kTokenReuseDetected) {
                ++reuse;
            } else {
                ++other;
            }
        });
    }
    go = true;
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(successes.load(), 1);
    EXPECT_EQ(reuse.load(), kThreads - 1);
    EXPECT_EQ(other.load(), 0);
    // 落败方触发了盗用检测, 整个令牌族都已失效
    auto active = store_->inner.FindActiveByUser("u1", clock_->NowSeconds());
    ASSERT_TRUE(active.IsOk());
    EXPECT_TRUE(active.Value().empty());
}

// 条件写落败: 在写入前插入另一个调用方的轮换
TEST_F(RotationEngineTest, LosingConditionalWriteTakesReuseBranch) {
    auto issued = Issue();
    bool injected = false;
    store_->hook = [&](const std::string& op) {
        if (op == "UpdateRevocation" && !injected) {
            injected = true;
            Revocation rival;
            rival.revoked_at = clock_->NowSeconds();
            rival.reason = RevocationReason::kRotated;
            rival.replaced_by_token = "rival-successor";
            EXPECT_TRUE(store_->inner.UpdateRevocation(issued.value, rival).IsOk());
        }
        return Status::OK();
    };

    auto rotated = Rotate(issued.value);
    EXPECT_EQ(rotated.Error(), TokenErrorCode::kTokenReuseDetected);

    auto family = store_->inner.FindByFamily(issued.token_family);
    ASSERT_TRUE(family.IsOk());
    ASSERT_EQ(family.Value().size(), 2u);
    for (const auto& token : family.Value()) {
        EXPECT_TRUE(token.IsRevoked());
    }
    EXPECT_EQ(Load(issued.value).revocation->replaced_by_token, "rival-successor");
}

// 签名失败时不产生任何写入
TEST_F(RotationEngineTest, SignerFailureLeavesStoreUntouched) {
    auto issued = Issue();
    signer_->fail = true;
    const int inserts_before = store_->CallsOf("Insert");

    auto rotated = Rotate(issued.value);
    EXPECT_FALSE(rotated.IsOk());
    EXPECT_EQ(rotated.Error(), TokenErrorCode::kInternal);
    EXPECT_EQ(store_->CallsOf("Insert"), inserts_before);
    EXPECT_FALSE(Load(issued.value).IsRevoked());
}

TEST_F(RotationEngineTest, MissingSignerYieldsEmptyAccessToken) {
    engine_ = std::make_unique<RotationEngine>(RotationConfig{}, store_, generator_, clock_, nullptr, events_);
    auto issued = Issue();
    auto rotated = Rotate(issued.value);
    ASSERT_TRUE(rotated.IsOk());
    EXPECT_TRUE(rotated.Value().access_token.empty());
    EXPECT_FALSE(rotated.Value().refresh_token.empty());
}

// 存储超时不能被误判为盗用
TEST_F(RotationEngineTest, StoreTimeoutSurfacesAsUnavailable) {
    auto issued = Issue();
    store_->hook = [](const std::string& op) {
        if (op == "FindByValue") {
            return Status::DeadlineExceeded("read timeout");
        }
        return Status::OK();
    };

    EXPECT_EQ(Rotate(issued.value).Error(), TokenErrorCode::kUnavailable);
    EXPECT_EQ(events_->CountOf(SecurityEventType::kTokenReuseDetected), 0u);
    store_->hook = nullptr;
    EXPECT_FALSE(Load(issued.value).IsRevoked());
}

// 吊销前驱失败: 回收孤立的后继, 前驱保持可用, 重试可以成功
TEST_F(RotationEngineTest, TransientFailureAfterInsertAbortsSuccessor) {
    auto issued = Issue();
    int update_calls = 0;
    store_->hook = [&](const std::string& op) {
        if (op == "UpdateRevocation" && ++update_calls == 1) {
            return Status::Unavailable("connection lost");
        }
        return Status::OK();
    };

    auto rotated = Rotate(issued.value);
    EXPECT_EQ(rotated.Error(), TokenErrorCode::kUnavailable);
    EXPECT_FALSE(Load(issued.value).IsRevoked());

    auto family = store_->inner.FindByFamily(issued.token_family);
    ASSERT_TRUE(family.IsOk());
    ASSERT_EQ(family.Value().size(), 2u);
    const auto& orphan = family.Value().front();
    EXPECT_NE(orphan.value, issued.value);
    ASSERT_TRUE(orphan.IsRevoked());
    EXPECT_EQ(orphan.revocation->reason, RevocationReason::kRotationAborted);

    auto retry = Rotate(issued.value);
    EXPECT_TRUE(retry.IsOk()) << retry.GetStatus().Message();
}

TEST_F(RotationEngineTest, CancelledCallPerformsNoStoreAccess) {
    auto issued = Issue();
    const int lookups_before = store_->CallsOf("FindByValue");
    auto ctx = CallContext::Background();
    ctx.Cancel();

    RotateCommand command;
    command.presented_value = issued.value;
    auto rotated = engine_->Rotate(command, ctx);
    EXPECT_EQ(rotated.Error(), TokenErrorCode::kCancelled);
    EXPECT_EQ(store_->CallsOf("FindByValue"), lookups_before);
}

// 查找之后才取消, 仍然不会写入
TEST_F(RotationEngineTest, CancellationBeforeWriteLeavesNoPartialState) {
    auto issued = Issue();
    auto ctx = CallContext::Background();
    store_->hook = [&ctx](const std::string& op) {
        if (op == "FindByValue") {
            ctx.Cancel();
        }
        return Status::OK();
    };
    const int inserts_before = store_->CallsOf("Insert");

    RotateCommand command;
    command.presented_value = issued.value;
    EXPECT_EQ(engine_->Rotate(command, ctx).Error(), TokenErrorCode::kCancelled);
    EXPECT_EQ(store_->CallsOf("Insert"), inserts_before);
    EXPECT_FALSE(Load(issued.value).IsRevoked());
}

TEST_F(RotationEngineTest, ExpiredDeadlineIsReportedAsCancelled) {
    auto issued = Issue();
    auto ctx = CallContext::WithDeadline(std::chrono::steady_clock::now() - std::chrono::seconds(1));
    RotateCommand command;
    command.presented_value = issued.value;
    EXPECT_EQ(engine_->Rotate(command, ctx).Error(), TokenErrorCode::kCancelled);

    IssueCommand issue;
    issue.user_id = "u2";
    EXPECT_EQ(engine_->IssueInitial(issue, ctx).Error(), TokenErrorCode::kCancelled);
}

// 生成的令牌值冲突时自动重试
TEST_F(RotationEngineTest, ValueCollisionIsRetried) {
    generator_->Enqueue("fixed-value");
    auto issued = Issue();
    ASSERT_EQ(issued.value, "fixed-value");

    generator_->Enqueue("fixed-value");
    auto rotated = Rotate(issued.value);
    ASSERT_TRUE(rotated.IsOk());
    EXPECT_NE(rotated.Value().refresh_token, "fixed-value");
}

TEST_F(RotationEngineTest, CollisionRetriesAreBounded) {
    generator_->Enqueue("fixed-value");
    auto issued = Issue();
    for (int i = 0; i < 3; ++i) {
        generator_->Enqueue("fixed-value");
    }

    auto rotated = Rotate(issued.value);
    EXPECT_EQ(rotated.Error(), TokenErrorCode::kInternal);
    EXPECT_FALSE(Load(issued.value).IsRevoked());
    EXPECT_EQ(store_->inner.Size(), 1u);
}

// 设备信息沿用前驱, 请求中提供的新值优先
TEST_F(RotationEngineTest, DeviceMetadataCarriesForward) {
    auto issued = Issue();
    auto quiet = Rotate(issued.value);
    ASSERT_TRUE(quiet.IsOk());
    auto carried = Load(quiet.Value().refresh_token);
    EXPECT_EQ(carried.created_by_ip, "10.0.0.1");
    EXPECT_EQ(carried.user_agent, "Mozilla/5.0");
    EXPECT_EQ(carried.device_fingerprint, "fp-laptop");
    EXPECT_EQ(carried.device_name, "Laptop");

    DeviceInfo moved;
    moved.ip = "192.168.1.20";
    auto updated = Rotate(quiet.Value().refresh_token, moved);
    ASSERT_TRUE(updated.IsOk());
    auto fresh = Load(updated.Value().refresh_token);
    EXPECT_EQ(fresh.created_by_ip, "192.168.1.20");
    EXPECT_EQ(fresh.device_name, "Laptop");
}

// 默认设备绑定仅作参考
TEST_F(RotationEngineTest, DeviceBindingIsAdvisoryByDefault) {
    auto issued = Issue();
    DeviceInfo other;
    other.device_fingerprint = "fp-phone";
    EXPECT_TRUE(Rotate(issued.value, other).IsOk());
    EXPECT_EQ(events_->CountOf(SecurityEventType::kDeviceMismatch), 0u);
}

TEST_F(RotationEngineTest, EnforcedDeviceBindingRevokesMismatchedToken) {
    RotationConfig config;
    config.enforce_device_binding = true;
    engine_ = MakeEngine(config);
    auto issued = Issue();

    DeviceInfo other;
    other.ip = "198.51.100.7";
    other.device_fingerprint = "fp-phone";
    EXPECT_EQ(Rotate(issued.value, other).Error(), TokenErrorCode::kDeviceMismatch);

    auto stored = Load(issued.value);
    ASSERT_TRUE(stored.IsRevoked());
    EXPECT_EQ(stored.revocation->reason, RevocationReason::kDeviceMismatch);
    EXPECT_EQ(events_->CountOf(SecurityEventType::kDeviceMismatch), 1u);

    // 被吊销后再提交即视为重用
    DeviceInfo same;
    same.device_fingerprint = "fp-laptop";
    EXPECT_EQ(Rotate(issued.value, same).Error(), TokenErrorCode::kTokenReuseDetected);
}

TEST_F(RotationEngineTest, EnforcedDeviceBindingAcceptsUnrecordedFingerprint) {
    RotationConfig config;
    config.enforce_device_binding = true;
    engine_ = MakeEngine(config);
    DeviceInfo unknown;
    unknown.ip = "10.0.0.2";
    auto issued = Issue("u1", unknown);

    DeviceInfo any;
    any.device_fingerprint = "fp-anything";
    EXPECT_TRUE(Rotate(issued.value, any).IsOk());
}

// 只读校验
TEST_F(RotationEngineTest, ValidateIsReadOnly) {
    auto issued = Issue();
    const int updates_before = store_->CallsOf("UpdateRevocation");

    auto valid = engine_->Validate(issued.value, "fp-laptop");
    ASSERT_TRUE(valid.IsOk());
    EXPECT_EQ(valid.Value().token_family, issued.token_family);

    EXPECT_EQ(engine_->Validate("missing", "").Error(), TokenErrorCode::kInvalidToken);

    auto rotated = Rotate(issued.value);
    ASSERT_TRUE(rotated.IsOk());
    EXPECT_EQ(engine_->Validate(issued.value, "").Error(), TokenErrorCode::kInvalidToken);

    clock_->AdvanceDays(8);
    EXPECT_EQ(engine_->Validate(rotated.Value().refresh_token, "").Error(), TokenErrorCode::kTokenExpired);
    EXPECT_EQ(store_->CallsOf("UpdateRevocation"), updates_before + 1);
    EXPECT_EQ(events_->CountOf(SecurityEventType::kTokenReuseDetected), 0u);
}

TEST_F(RotationEngineTest, ValidateChecksDeviceWhenEnforced) {
    RotationConfig config;
    config.enforce_device_binding = true;
    engine_ = MakeEngine(config);
    auto issued = Issue();

    EXPECT_EQ(engine_->Validate(issued.value, "fp-phone").Error(), TokenErrorCode::kDeviceMismatch);
    EXPECT_FALSE(Load(issued.value).IsRevoked());
    EXPECT_TRUE(engine_->Validate(issued.value, "fp-laptop").IsOk());
}

// 超出并发会话上限时挤出最早的会话
TEST_F(RotationEngineTest, SessionLimitEvictsOldestFamilies) {
    RotationConfig config;
    config.max_concurrent_sessions = 2;
    engine_ = MakeEngine(config);

    auto oldest = Issue();
    clock_->AdvanceSeconds(10);
    auto middle = Issue();
    clock_->AdvanceSeconds(10);
    auto newest = Issue();

    auto evicted = Load(oldest.value);
    ASSERT_TRUE(evicted.IsRevoked());
    EXPECT_EQ(evicted.revocation->reason, RevocationReason::kSessionLimitReached);
    EXPECT_FALSE(Load(middle.value).IsRevoked());
    EXPECT_FALSE(Load(newest.value).IsRevoked());
    EXPECT_EQ(events_->CountOf(SecurityEventType::kSessionLimitEnforced), 1u);

    // 其他用户不受影响
    Issue("u2");
    EXPECT_FALSE(Load(middle.value).IsRevoked());
}

TEST_F(RotationEngineTest, ZeroSessionLimitMeansUnlimited) {
    std::vector<IssuedToken> issued;
    for (int i = 0; i < 5; ++i) {
        issued.push_back(Issue());
        clock_->AdvanceSeconds(1);
    }
    for (const auto& token : issued) {
        EXPECT_FALSE(Load(token.value).IsRevoked());
    }
}

// 对外状态中过期与重用不可区分
TEST_F(RotationEngineTest, ExpiredAndReusedLookIdenticalExternally) {
    auto expired = FromTokenError(TokenStatus(TokenErrorCode::kTokenExpired, "expired"));
    auto reused = FromTokenError(TokenStatus(TokenErrorCode::kTokenReuseDetected, "reuse"));
    EXPECT_EQ(expired.Code(), StatusCode::kUnauthenticated);
    EXPECT_EQ(reused.Code(), StatusCode::kUnauthenticated);
    EXPECT_EQ(expired.Message(), reused.Message());

    EXPECT_EQ(FromTokenError(TokenStatus(TokenErrorCode::kForbidden, "")).Code(), StatusCode::kPermissionDenied);
    EXPECT_EQ(FromStoreStatus(Status::DeadlineExceeded("slow")).Code(), TokenErrorCode::kUnavailable);
    EXPECT_EQ(FromStoreStatus(Status::AlreadyExists("dup")).Code(), TokenErrorCode::kConflict);
}
