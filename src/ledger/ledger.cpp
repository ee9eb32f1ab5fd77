// STAKELEDGER - Staking Ledger Implementation
// Copyright (c) 2024 STAKELEDGER Developers
// MIT License

#include "stakeledger/ledger/ledger.h"
#include "stakeledger/util/logging.h"
#include "stakeledger/util/time.h"

#include <sstream>
#include <stdexcept>

namespace stakeledger {
namespace ledger {

namespace {

__extension__ typedef unsigned __int128 UInt128;

constexpr UInt128 UINT128_MAX_VALUE = ~static_cast<UInt128>(0);

} // namespace

// ============================================================================
// String Conversions
// ============================================================================

const char* ParticipantStateToString(ParticipantState state) {
    switch (state) {
        case ParticipantState::Idle: return "Idle";
        case ParticipantState::Staked: return "Staked";
        case ParticipantState::Applied: return "Applied";
        case ParticipantState::Unlocked: return "Unlocked";
        default: return "Unknown";
    }
}

std::string PendingClaim::ToString() const {
    std::ostringstream ss;
    ss << "PendingClaim(principal=" << principal << ", reward=" << reward
       << ", unlockAt=" << util::FormatISO8601(unlockAt) << ")";
    return ss.str();
}

// ============================================================================
// Reward Calculation
// ============================================================================

std::optional<Amount> CalculatePositionReward(Amount amount, uint32_t ratePercent,
                                              int64_t elapsedSeconds) {
    if (elapsedSeconds <= 0 || amount == 0 || ratePercent == 0) {
        return Amount{0};
    }

    UInt128 value = static_cast<UInt128>(amount) * ratePercent;
    UInt128 elapsed = static_cast<UInt128>(elapsedSeconds);
    if (value > UINT128_MAX_VALUE / elapsed) {
        return std::nullopt;
    }
    value *= elapsed;
    value /= 100;
    value /= static_cast<UInt128>(SECONDS_PER_YEAR);

    if (value > static_cast<UInt128>(MAX_AMOUNT)) {
        return std::nullopt;
    }
    return static_cast<Amount>(value);
}

// ============================================================================
// Construction
// ============================================================================

StakingLedger::StakingLedger(const LedgerParameters& genesis, const Address& owner,
                             std::shared_ptr<LedgerStore> store)
    : store_(std::move(store)) {
    if (store_ && store_->IsInitialized()) {
        LedgerState state = store_->Load();
        params_ = state.params;
        access_.Restore(state.owner);
        totalStaked_ = state.totalStaked;
        positions_ = std::move(state.positions);
        claims_ = std::move(state.claims);

        LOG_INFO(util::LogCategory::LEDGER) << "Loaded ledger: " << params_.ToString()
                                            << ", total staked " << totalStaked_;
        return;
    }

    auto valid = ValidateParameters(genesis);
    if (!valid.ok()) {
        throw std::invalid_argument("Invalid genesis parameters: " + valid.message);
    }
    params_ = genesis;
    access_.Restore(owner);

    if (store_) {
        LedgerState state;
        state.params = params_;
        state.owner = owner;
        db::Status s = store_->WriteGenesis(state);
        if (!s.ok()) {
            throw std::runtime_error("Failed to write genesis ledger: " + s.ToString());
        }
    }

    LOG_INFO(util::LogCategory::LEDGER) << "Created ledger: " << params_.ToString();

    LedgerEvent event;
    event.type = EventType::OwnershipTransferred;
    event.newOwner = owner;
    Emit(event);
}

// ============================================================================
// Internal Helpers
// ============================================================================

LedgerResult StakingLedger::Reject(const char* op, const Address& participant,
                                   LedgerResult result) const {
    LOG_DEBUG(util::LogCategory::LEDGER) << op << " rejected for " << participant.ToHex()
                                         << ": " << LedgerErrorToString(result.error)
                                         << " (" << result.message << ")";
    return result;
}

db::Status StakingLedger::CommitParticipant(const Address& participant) {
    if (!store_) {
        return db::Status::Ok();
    }
    db::WriteBatch batch;

    auto posIt = positions_.find(participant);
    if (posIt != positions_.end()) {
        store_->StagePositions(batch, participant, posIt->second);
    } else {
        store_->StagePositions(batch, participant, {});
    }

    auto claimIt = claims_.find(participant);
    if (claimIt != claims_.end()) {
        store_->StageClaim(batch, participant, claimIt->second);
    } else {
        store_->StageClaimErase(batch, participant);
    }

    store_->StageTotal(batch, totalStaked_);
    return store_->Commit(batch);
}

LedgerResult StakingLedger::CommitParameters(const LedgerParameters& updated) {
    if (store_) {
        db::WriteBatch batch;
        store_->StageParameters(batch, updated);
        db::Status s = store_->Commit(batch);
        if (!s.ok()) {
            return LedgerResult::Error(LedgerError::STORAGE_ERROR, s.ToString());
        }
    }
    params_ = updated;
    return LedgerResult::Ok();
}

void StakingLedger::ReturnFunds(IBaseToken& token, const Address& participant, Amount amount) {
    if (!token.TransferOut(participant, amount)) {
        LOG_FATAL(util::LogCategory::LEDGER) << "Could not return " << amount << " "
                                             << token.GetSymbol() << " to "
                                             << participant.ToHex();
        throw LedgerIntegrityError("failed to return staked funds to " + participant.ToHex());
    }
}

void StakingLedger::RestoreClaim(const Address& participant, const PendingClaim& claim) {
    Amount restoredTotal = 0;
    if (claims_.count(participant) > 0 ||
        !CheckedAdd(totalStaked_, claim.principal, restoredTotal)) {
        LOG_FATAL(util::LogCategory::LEDGER) << "Cannot restore " << claim.ToString()
                                             << " for " << participant.ToHex();
        throw LedgerIntegrityError("claim of " + participant.ToHex() + " cannot be restored");
    }
    claims_[participant] = claim;
    totalStaked_ = restoredTotal;

    db::Status s = CommitParticipant(participant);
    if (!s.ok()) {
        LOG_FATAL(util::LogCategory::LEDGER) << "Restored claim of " << participant.ToHex()
                                             << " could not be persisted: " << s.ToString();
        throw LedgerIntegrityError("restored claim of " + participant.ToHex() +
                                   " could not be persisted");
    }
}

void StakingLedger::Emit(LedgerEvent event) {
    if (event.timestamp == 0) {
        event.timestamp = util::GetTime();
    }
    LOG_INFO(util::LogCategory::LEDGER) << "Event " << event.ToString();

    eventHistory_.push_back(event);
    while (eventHistory_.size() > MAX_EVENT_HISTORY) {
        eventHistory_.pop_front();
    }

    // Listeners may register further listeners
    auto listeners = listeners_;
    for (const auto& listener : listeners) {
        listener(event);
    }
}

void StakingLedger::AddEventListener(EventCallback callback) {
    if (callback) {
        listeners_.push_back(std::move(callback));
    }
}

// ============================================================================
// Participant Operations
// ============================================================================

LedgerResult StakingLedger::CheckStakeAllowed(const Address& participant, Amount amount) const {
    if (participant.IsNull()) {
        return LedgerResult::Error(LedgerError::INVALID_PARTICIPANT);
    }
    if (amount == 0) {
        return LedgerResult::Error(LedgerError::INVALID_AMOUNT, "stake amount must be positive");
    }
    if (!baseToken_) {
        return LedgerResult::Error(LedgerError::TOKEN_NOT_SET, "no base token attached");
    }
    Amount newTotal = 0;
    if (!CheckedAdd(totalStaked_, amount, newTotal)) {
        return LedgerResult::Error(LedgerError::AMOUNT_OVERFLOW,
            "total staked would exceed " + std::to_string(MAX_AMOUNT));
    }
    if (maxPositions_ > 0) {
        auto it = positions_.find(participant);
        if (it != positions_.end() && it->second.size() >= maxPositions_) {
            return LedgerResult::Error(LedgerError::POSITION_LIMIT_REACHED,
                "participant already holds " + std::to_string(it->second.size()) +
                " positions");
        }
    }
    return LedgerResult::Ok();
}

LedgerResult StakingLedger::Stake(const Address& participant, Amount amount) {
    auto check = CheckStakeAllowed(participant, amount);
    if (!check.ok()) {
        return Reject("stake", participant, check);
    }

    // Held locally so a re-entrant SetBaseToken cannot drop it mid-operation
    std::shared_ptr<IBaseToken> token = baseToken_;
    if (!token->TransferIn(participant, amount)) {
        return Reject("stake", participant, LedgerResult::Error(LedgerError::TRANSFER_FAILED,
            "could not take " + std::to_string(amount) + " " + token->GetSymbol()));
    }

    // The transfer may have re-entered the ledger
    check = CheckStakeAllowed(participant, amount);
    if (!check.ok()) {
        ReturnFunds(*token, participant, amount);
        return Reject("stake", participant, check);
    }

    auto& positions = positions_[participant];
    positions.push_back(Position{amount, util::GetTime()});
    totalStaked_ += amount;

    db::Status s = CommitParticipant(participant);
    if (!s.ok()) {
        positions.pop_back();
        if (positions.empty()) {
            positions_.erase(participant);
        }
        totalStaked_ -= amount;
        ReturnFunds(*token, participant, amount);
        return Reject("stake", participant,
                      LedgerResult::Error(LedgerError::STORAGE_ERROR, s.ToString()));
    }

    LOG_INFO(util::LogCategory::LEDGER) << participant.ToHex() << " staked " << amount
                                        << " " << token->GetSymbol() << " (total "
                                        << totalStaked_ << ")";

    LedgerEvent event;
    event.type = EventType::Staked;
    event.participant = participant;
    event.principal = amount;
    Emit(event);
    return LedgerResult::Ok();
}

LedgerResult StakingLedger::ApplyClaim(const Address& participant) {
    if (participant.IsNull()) {
        return Reject("applyclaim", participant,
                      LedgerResult::Error(LedgerError::INVALID_PARTICIPANT));
    }
    if (claims_.count(participant) > 0) {
        return Reject("applyclaim", participant, LedgerResult::Error(LedgerError::CLAIM_PENDING,
            "a claim is already pending"));
    }

    Amount principal = CalculatePrincipal(participant);
    if (principal == 0) {
        return Reject("applyclaim", participant, LedgerResult::Error(LedgerError::NO_STAKING));
    }
    auto reward = CalculateReward(participant);
    if (!reward) {
        return Reject("applyclaim", participant,
                      LedgerResult::Error(LedgerError::AMOUNT_OVERFLOW, "reward does not fit"));
    }
    if (*reward == 0) {
        return Reject("applyclaim", participant, LedgerResult::Error(LedgerError::NO_REWARDS));
    }

    PendingClaim claim;
    claim.principal = principal;
    claim.reward = *reward;
    claim.unlockAt = util::GetTime() + params_.cooldownSeconds;

    auto savedPositions = std::move(positions_[participant]);
    positions_.erase(participant);
    claims_[participant] = claim;

    db::Status s = CommitParticipant(participant);
    if (!s.ok()) {
        claims_.erase(participant);
        positions_[participant] = std::move(savedPositions);
        return Reject("applyclaim", participant,
                      LedgerResult::Error(LedgerError::STORAGE_ERROR, s.ToString()));
    }

    LOG_INFO(util::LogCategory::LEDGER) << participant.ToHex() << " applied for "
                                        << claim.ToString();

    LedgerEvent event;
    event.type = EventType::ClaimApplied;
    event.participant = participant;
    event.principal = claim.principal;
    event.reward = claim.reward;
    Emit(event);
    return LedgerResult::Ok();
}

LedgerResult StakingLedger::Claim(const Address& participant) {
    if (participant.IsNull()) {
        return Reject("claim", participant, LedgerResult::Error(LedgerError::INVALID_PARTICIPANT));
    }
    auto it = claims_.find(participant);
    if (it == claims_.end()) {
        return Reject("claim", participant, LedgerResult::Error(LedgerError::NO_CLAIM));
    }

    Timestamp now = util::GetTime();
    if (!it->second.IsUnlocked(now)) {
        return Reject("claim", participant, LedgerResult::Error(LedgerError::CLAIM_TOO_EARLY,
            "unlocks in " + util::FormatDuration(util::Seconds{it->second.unlockAt - now})));
    }
    if (!baseToken_) {
        return Reject("claim", participant,
                      LedgerResult::Error(LedgerError::TOKEN_NOT_SET, "no base token attached"));
    }
    if (it->second.reward > 0 && !rewardIssuer_) {
        return Reject("claim", participant,
                      LedgerResult::Error(LedgerError::TOKEN_NOT_SET, "no reward issuer attached"));
    }

    const PendingClaim claim = it->second;
    std::shared_ptr<IBaseToken> token = baseToken_;
    std::shared_ptr<IRewardIssuer> issuer = rewardIssuer_;

    // Settle before paying out
    claims_.erase(it);
    totalStaked_ -= claim.principal;

    db::Status s = CommitParticipant(participant);
    if (!s.ok()) {
        claims_[participant] = claim;
        totalStaked_ += claim.principal;
        return Reject("claim", participant,
                      LedgerResult::Error(LedgerError::STORAGE_ERROR, s.ToString()));
    }

    if (!token->TransferOut(participant, claim.principal)) {
        LOG_WARN(util::LogCategory::LEDGER) << "Principal transfer to " << participant.ToHex()
                                            << " failed, restoring claim";
        RestoreClaim(participant, claim);
        return Reject("claim", participant, LedgerResult::Error(LedgerError::TRANSFER_FAILED,
            "could not send " + std::to_string(claim.principal) + " " + token->GetSymbol()));
    }

    if (claim.reward > 0 && !issuer->Issue(participant, claim.reward)) {
        LOG_WARN(util::LogCategory::LEDGER) << "Reward issue to " << participant.ToHex()
                                            << " failed, reversing principal transfer";
        if (!token->TransferIn(participant, claim.principal)) {
            LOG_FATAL(util::LogCategory::LEDGER) << "Could not take back " << claim.principal
                                                 << " " << token->GetSymbol() << " from "
                                                 << participant.ToHex();
            throw LedgerIntegrityError("principal paid to " + participant.ToHex() +
                                       " without reward and could not be reversed");
        }
        RestoreClaim(participant, claim);
        return Reject("claim", participant, LedgerResult::Error(LedgerError::ISSUE_FAILED,
            "could not issue " + std::to_string(claim.reward) + " " + issuer->GetSymbol()));
    }

    LOG_INFO(util::LogCategory::LEDGER) << participant.ToHex() << " claimed "
                                        << claim.principal << " principal and "
                                        << claim.reward << " reward";

    LedgerEvent event;
    event.type = EventType::Claimed;
    event.participant = participant;
    event.principal = claim.principal;
    event.reward = claim.reward;
    Emit(event);
    return LedgerResult::Ok();
}

// ============================================================================
// Queries
// ============================================================================

Amount StakingLedger::CalculatePrincipal(const Address& participant) const {
    auto it = positions_.find(participant);
    if (it == positions_.end()) {
        return 0;
    }
    // Bounded by totalStaked_, which never overflows
    Amount principal = 0;
    for (const auto& pos : it->second) {
        principal += pos.amount;
    }
    return principal;
}

std::optional<Amount> StakingLedger::CalculateReward(const Address& participant) const {
    auto it = positions_.find(participant);
    if (it == positions_.end()) {
        return Amount{0};
    }
    Timestamp now = util::GetTime();
    Amount total = 0;
    for (const auto& pos : it->second) {
        auto reward = CalculatePositionReward(pos.amount, params_.annualRatePercent,
                                              now - pos.createdAt);
        if (!reward || !CheckedAdd(total, *reward, total)) {
            return std::nullopt;
        }
    }
    return total;
}

Amount StakingLedger::GetStakedTotal(const Address& participant) const {
    Amount total = CalculatePrincipal(participant);
    auto it = claims_.find(participant);
    if (it != claims_.end()) {
        total += it->second.principal;
    }
    return total;
}

std::optional<RewardView> StakingLedger::GetRewards(const Address& participant) const {
    auto accruing = CalculateReward(participant);
    if (!accruing) {
        return std::nullopt;
    }
    RewardView view;
    view.accruingReward = *accruing;
    auto it = claims_.find(participant);
    if (it != claims_.end()) {
        view.pendingReward = it->second.reward;
    }
    return view;
}

std::vector<Position> StakingLedger::GetPositions(const Address& participant) const {
    auto it = positions_.find(participant);
    if (it == positions_.end()) {
        return {};
    }
    return it->second;
}

std::optional<PendingClaim> StakingLedger::GetPendingClaim(const Address& participant) const {
    auto it = claims_.find(participant);
    if (it == claims_.end()) {
        return std::nullopt;
    }
    return it->second;
}

ParticipantState StakingLedger::GetParticipantState(const Address& participant) const {
    auto it = claims_.find(participant);
    if (it != claims_.end()) {
        return it->second.IsUnlocked(util::GetTime()) ? ParticipantState::Unlocked
                                                      : ParticipantState::Applied;
    }
    return positions_.count(participant) > 0 ? ParticipantState::Staked
                                             : ParticipantState::Idle;
}

size_t StakingLedger::GetParticipantCount() const {
    size_t count = positions_.size();
    for (const auto& [participant, claim] : claims_) {
        if (positions_.count(participant) == 0) {
            ++count;
        }
    }
    return count;
}

// ============================================================================
// Privileged Operations
// ============================================================================

LedgerResult StakingLedger::SetAnnualRate(const Address& caller, uint64_t ratePercent) {
    auto check = access_.CheckOwner(caller);
    if (!check.ok()) {
        return Reject("setrate", caller, check);
    }
    if (!IsValidAnnualRate(ratePercent)) {
        return Reject("setrate", caller, LedgerResult::Error(LedgerError::RATE_OUT_OF_RANGE,
            std::to_string(ratePercent) + "% exceeds " + std::to_string(MAX_ANNUAL_RATE) + "%"));
    }

    LedgerParameters updated = params_;
    updated.annualRatePercent = static_cast<uint32_t>(ratePercent);
    auto result = CommitParameters(updated);
    if (!result.ok()) {
        return Reject("setrate", caller, result);
    }
    LOG_INFO(util::LogCategory::LEDGER) << "Annual rate set to " << ratePercent << "%";
    return result;
}

LedgerResult StakingLedger::SetCooldown(const Address& caller, int64_t seconds) {
    auto check = access_.CheckOwner(caller);
    if (!check.ok()) {
        return Reject("setcooldown", caller, check);
    }
    if (!IsValidCooldown(seconds)) {
        return Reject("setcooldown", caller, LedgerResult::Error(
            LedgerError::COOLDOWN_OUT_OF_RANGE,
            std::to_string(seconds) + "s outside [0, " + std::to_string(MAX_COOLDOWN) + "]"));
    }

    LedgerParameters updated = params_;
    updated.cooldownSeconds = seconds;
    auto result = CommitParameters(updated);
    if (!result.ok()) {
        return Reject("setcooldown", caller, result);
    }
    LOG_INFO(util::LogCategory::LEDGER) << "Cooldown set to "
                                        << util::FormatDuration(util::Seconds{seconds});
    return result;
}

LedgerResult StakingLedger::SetBaseToken(const Address& caller, std::shared_ptr<IBaseToken> token) {
    auto check = access_.CheckOwner(caller);
    if (!check.ok()) {
        return Reject("setbasetoken", caller, check);
    }
    if (!token || !IsValidSymbol(token->GetSymbol())) {
        return Reject("setbasetoken", caller,
                      LedgerResult::Error(LedgerError::TOKEN_NOT_SET, "invalid base token"));
    }

    LedgerParameters updated = params_;
    updated.baseToken = token->GetSymbol();
    auto result = CommitParameters(updated);
    if (!result.ok()) {
        return Reject("setbasetoken", caller, result);
    }
    baseToken_ = std::move(token);
    LOG_INFO(util::LogCategory::LEDGER) << "Base token set to " << params_.baseToken;
    return result;
}

LedgerResult StakingLedger::SetRewardToken(const Address& caller,
                                           std::shared_ptr<IRewardIssuer> issuer) {
    auto check = access_.CheckOwner(caller);
    if (!check.ok()) {
        return Reject("setrewardtoken", caller, check);
    }
    if (!issuer || !IsValidSymbol(issuer->GetSymbol())) {
        return Reject("setrewardtoken", caller,
                      LedgerResult::Error(LedgerError::TOKEN_NOT_SET, "invalid reward token"));
    }

    LedgerParameters updated = params_;
    updated.rewardToken = issuer->GetSymbol();
    auto result = CommitParameters(updated);
    if (!result.ok()) {
        return Reject("setrewardtoken", caller, result);
    }
    rewardIssuer_ = std::move(issuer);
    LOG_INFO(util::LogCategory::LEDGER) << "Reward token set to " << params_.rewardToken;
    return result;
}

LedgerResult StakingLedger::TransferOwnership(const Address& caller, const Address& newOwner) {
    AccessControl updated = access_;
    auto result = updated.TransferOwnership(caller, newOwner);
    if (!result.ok()) {
        return Reject("transferowner", caller, result);
    }
    if (store_) {
        db::WriteBatch batch;
        store_->StageOwner(batch, newOwner);
        db::Status s = store_->Commit(batch);
        if (!s.ok()) {
            return Reject("transferowner", caller,
                          LedgerResult::Error(LedgerError::STORAGE_ERROR, s.ToString()));
        }
    }

    LedgerEvent event;
    event.type = EventType::OwnershipTransferred;
    event.previousOwner = access_.GetOwner();
    event.newOwner = newOwner;
    access_ = updated;
    Emit(event);
    return result;
}

LedgerResult StakingLedger::RenounceOwnership(const Address& caller) {
    AccessControl updated = access_;
    auto result = updated.RenounceOwnership(caller);
    if (!result.ok()) {
        return Reject("renounceowner", caller, result);
    }
    if (store_) {
        db::WriteBatch batch;
        store_->StageOwner(batch, Address());
        db::Status s = store_->Commit(batch);
        if (!s.ok()) {
            return Reject("renounceowner", caller,
                          LedgerResult::Error(LedgerError::STORAGE_ERROR, s.ToString()));
        }
    }

    LedgerEvent event;
    event.type = EventType::OwnershipTransferred;
    event.previousOwner = access_.GetOwner();
    access_ = updated;
    Emit(event);
    return result;
}

// ============================================================================
// Host Wiring
// ============================================================================

bool StakingLedger::AttachBaseToken(std::shared_ptr<IBaseToken> token) {
    if (!token || params_.baseToken.empty() || token->GetSymbol() != params_.baseToken) {
        return false;
    }
    baseToken_ = std::move(token);
    return true;
}

bool StakingLedger::AttachRewardIssuer(std::shared_ptr<IRewardIssuer> issuer) {
    if (!issuer || params_.rewardToken.empty() || issuer->GetSymbol() != params_.rewardToken) {
        return false;
    }
    rewardIssuer_ = std::move(issuer);
    return true;
}

} // namespace ledger
} // namespace stakeledger
