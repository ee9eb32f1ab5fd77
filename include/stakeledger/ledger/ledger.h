// STAKELEDGER - Staking Ledger
// Copyright (c) 2024 STAKELEDGER Developers
// MIT License
//
// Participants deposit a base token, accrue time-proportional interest paid
// in a reward token, and withdraw principal plus reward after a cooldown.
//
// Withdrawal is two-phase:
// - ApplyClaim freezes all of a participant's positions into one pending
//   claim (principal + reward computed at that moment)
// - Claim pays the pending claim out once its unlock time is reached
//
// Interest on positions that are not yet applied always uses the current
// annual rate, across the whole life of the position.

#ifndef STAKELEDGER_LEDGER_LEDGER_H
#define STAKELEDGER_LEDGER_LEDGER_H

#include "stakeledger/core/types.h"
#include "stakeledger/ledger/access.h"
#include "stakeledger/ledger/error.h"
#include "stakeledger/ledger/events.h"
#include "stakeledger/ledger/ledgerdb.h"
#include "stakeledger/ledger/params.h"
#include "stakeledger/ledger/position.h"
#include "stakeledger/ledger/token.h"

#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <optional>
#include <vector>

namespace stakeledger {
namespace ledger {

/// Events kept in the in-memory history
constexpr size_t MAX_EVENT_HISTORY = 1024;

// ============================================================================
// Participant State
// ============================================================================

enum class ParticipantState {
    /// No positions and no pending claim
    Idle,

    /// Holds positions, no pending claim
    Staked,

    /// Pending claim still in cooldown
    Applied,

    /// Pending claim ready to be claimed
    Unlocked
};

/// Convert state to string
const char* ParticipantStateToString(ParticipantState state);

/// Both reward figures for a participant. They are reported separately.
struct RewardView {
    /// Reward frozen in the pending claim (0 if none)
    Amount pendingReward{0};

    /// Reward accrued so far on positions not yet applied
    Amount accruingReward{0};
};

// ============================================================================
// Reward Calculation
// ============================================================================

/**
 * Interest earned by one position.
 *
 * amount * ratePercent * elapsed / 100 / SECONDS_PER_YEAR, dividing with
 * truncation in that order. Negative elapsed time earns nothing.
 *
 * @return Reward, or nullopt if it does not fit in Amount
 */
std::optional<Amount> CalculatePositionReward(Amount amount, uint32_t ratePercent,
                                              int64_t elapsedSeconds);

// ============================================================================
// Staking Ledger
// ============================================================================

/**
 * The staking ledger.
 *
 * Every operation runs to completion or leaves no effect. State changes are
 * committed (in memory and in the store) before any call into a token
 * collaborator, so a collaborator calling back into the ledger sees the
 * post-mutation state. Not thread-safe; callers serialize access.
 */
class StakingLedger {
public:
    /**
     * Open a ledger.
     *
     * With a store that already holds a ledger, the persisted state is loaded
     * and the genesis arguments are ignored. Otherwise the genesis state is
     * written and OwnershipTransferred(null, owner) is emitted.
     *
     * @param genesis Parameters for a fresh ledger
     * @param owner Privileged identity for a fresh ledger
     * @param store Backing store, or nullptr for a volatile ledger
     * @throws std::invalid_argument if the genesis parameters are invalid
     * @throws std::runtime_error if the store cannot be read or written
     */
    StakingLedger(const LedgerParameters& genesis, const Address& owner,
                  std::shared_ptr<LedgerStore> store = nullptr);

    StakingLedger(const StakingLedger&) = delete;
    StakingLedger& operator=(const StakingLedger&) = delete;

    // === Participant Operations ===

    /**
     * Deposit amount of the base token.
     * Pulls the funds through IBaseToken::TransferIn, then records a
     * Position{amount, now}.
     */
    LedgerResult Stake(const Address& participant, Amount amount);

    /**
     * Freeze all positions into a pending claim unlocking after the cooldown.
     * Rejects an existing claim, zero principal and zero reward, in that order.
     * The aggregate total is unchanged.
     */
    LedgerResult ApplyClaim(const Address& participant);

    /**
     * Pay out an unlocked pending claim: principal through
     * IBaseToken::TransferOut, reward through IRewardIssuer::Issue.
     * If either collaborator fails, everything is rolled back.
     *
     * @throws LedgerIntegrityError if the rollback itself cannot complete
     */
    LedgerResult Claim(const Address& participant);

    // === Queries ===

    /// Sum of the participant's positions
    Amount CalculatePrincipal(const Address& participant) const;

    /// Reward accrued on the participant's positions at the current rate
    std::optional<Amount> CalculateReward(const Address& participant) const;

    /// Positions plus pending claim principal
    Amount GetStakedTotal(const Address& participant) const;

    /// Pending and accruing reward; nullopt on overflow
    std::optional<RewardView> GetRewards(const Address& participant) const;

    std::vector<Position> GetPositions(const Address& participant) const;
    std::optional<PendingClaim> GetPendingClaim(const Address& participant) const;
    ParticipantState GetParticipantState(const Address& participant) const;

    /// Aggregate outstanding principal (positions + pending claims)
    Amount GetTotalStaked() const { return totalStaked_; }

    const LedgerParameters& GetParameters() const { return params_; }

    /// Number of participants with positions or a pending claim
    size_t GetParticipantCount() const;

    // === Privileged Operations ===

    LedgerResult SetAnnualRate(const Address& caller, uint64_t ratePercent);
    LedgerResult SetCooldown(const Address& caller, int64_t seconds);

    /// Attach a new base token and record its symbol
    LedgerResult SetBaseToken(const Address& caller, std::shared_ptr<IBaseToken> token);

    /// Attach a new reward issuer and record its symbol
    LedgerResult SetRewardToken(const Address& caller, std::shared_ptr<IRewardIssuer> issuer);

    const Address& GetOwner() const { return access_.GetOwner(); }
    LedgerResult TransferOwnership(const Address& caller, const Address& newOwner);
    LedgerResult RenounceOwnership(const Address& caller);

    // === Host Wiring ===

    /**
     * Reconnect collaborators after loading. The symbol must match the
     * recorded one.
     * @return false on a symbol mismatch
     */
    bool AttachBaseToken(std::shared_ptr<IBaseToken> token);
    bool AttachRewardIssuer(std::shared_ptr<IRewardIssuer> issuer);

    /// Cap positions per participant (0 = unlimited)
    void SetMaxPositions(size_t maxPositions) { maxPositions_ = maxPositions; }
    size_t GetMaxPositions() const { return maxPositions_; }

    // === Events ===

    void AddEventListener(EventCallback callback);

    /// Most recent events, oldest first
    const std::deque<LedgerEvent>& GetEventHistory() const { return eventHistory_; }

    bool IsPersistent() const { return store_ != nullptr; }

private:
    LedgerResult Reject(const char* op, const Address& participant, LedgerResult result) const;
    LedgerResult CheckStakeAllowed(const Address& participant, Amount amount) const;
    LedgerResult CommitParameters(const LedgerParameters& updated);
    db::Status CommitParticipant(const Address& participant);

    /// Refund a stake; throws LedgerIntegrityError if the token refuses
    void ReturnFunds(IBaseToken& token, const Address& participant, Amount amount);

    /// Undo a settled claim after a failed payout
    void RestoreClaim(const Address& participant, const PendingClaim& claim);
    void Emit(LedgerEvent event);

    LedgerParameters params_;
    AccessControl access_;
    Amount totalStaked_{0};

    std::map<Address, std::vector<Position>> positions_;
    std::map<Address, PendingClaim> claims_;

    std::shared_ptr<IBaseToken> baseToken_;
    std::shared_ptr<IRewardIssuer> rewardIssuer_;
    std::shared_ptr<LedgerStore> store_;

    size_t maxPositions_{0};

    std::vector<EventCallback> listeners_;
    std::deque<LedgerEvent> eventHistory_;
};

} // namespace ledger
} // namespace stakeledger

#endif // STAKELEDGER_LEDGER_LEDGER_H
