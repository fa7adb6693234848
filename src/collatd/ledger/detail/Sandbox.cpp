#include <collatd/ledger/Sandbox.h>

#include <collat/basics/contract.h>

#include <limits>
#include <string>

namespace collat {

Sandbox::Sandbox(ReadView const& base) : base_(base), next_(base.nextLoanID())
{
}

std::shared_ptr<Loan const>
Sandbox::read(LoanID id) const
{
    if (auto const iter = items_.find(id); iter != items_.end())
        return iter->second;
    return base_.read(id);
}

bool
Sandbox::isVerified(AccountID const& account) const
{
    if (auto const iter = verified_.find(account); iter != verified_.end())
        return iter->second;
    return base_.isVerified(account);
}

LoanID
Sandbox::nextLoanID() const
{
    return next_;
}

std::shared_ptr<Loan>
Sandbox::peek(LoanID id)
{
    if (auto const iter = items_.find(id); iter != items_.end())
        return iter->second;

    auto const loan = base_.read(id);
    if (!loan)
        return nullptr;

    auto copy = std::make_shared<Loan>(*loan);
    items_.emplace(id, copy);
    return copy;
}

Expected<LoanID, TER>
Sandbox::create(Loan loan)
{
    if (next_ == 0)
        return Unexpected(tecDIR_FULL);

    LoanID const id = next_;
    next_ = (id == std::numeric_limits<LoanID>::max()) ? 0 : id + 1;

    loan.id = id;
    items_.emplace(id, std::make_shared<Loan>(loan));
    actions_.emplace_back(Create{std::move(loan)});
    return id;
}

TER
Sandbox::markRepaid(LoanID id)
{
    auto const loan = peek(id);
    if (!loan)
        return tecNO_ENTRY;

    if (auto const ter = finalizeLoan(*loan, LoanStatus::repaid);
        !isTesSuccess(ter))
        return ter;

    actions_.emplace_back(Finalize{id, LoanStatus::repaid});
    return tesSUCCESS;
}

TER
Sandbox::markDefaulted(LoanID id)
{
    auto const loan = peek(id);
    if (!loan)
        return tecNO_ENTRY;

    if (auto const ter = finalizeLoan(*loan, LoanStatus::defaulted);
        !isTesSuccess(ter))
        return ter;

    actions_.emplace_back(Finalize{id, LoanStatus::defaulted});
    return tesSUCCESS;
}

TER
Sandbox::markDisbursed(LoanID id)
{
    auto const loan = peek(id);
    if (!loan)
        return tecNO_ENTRY;

    if (auto const ter = disburseLoan(*loan); !isTesSuccess(ter))
        return ter;

    actions_.emplace_back(Disburse{id});
    return tesSUCCESS;
}

void
Sandbox::setVerified(AccountID const& account, bool verified)
{
    verified_[account] = verified;
    actions_.emplace_back(Verify{account, verified});
}

void
Sandbox::apply(ApplyView& to)
{
    auto check = [](TER ter, LoanID id, char const* what) {
        if (!isTesSuccess(ter))
            LogicError(
                std::string("Sandbox::apply : ") + what + " of loan " +
                std::to_string(id) + " refused: " + transToken(ter));
    };

    for (auto& action : actions_)
    {
        if (auto const* c = std::get_if<Create>(&action))
        {
            auto const id = to.create(c->loan);
            if (!id)
                check(id.error(), c->loan.id, "create");
            else if (*id != c->loan.id)
                LogicError(
                    "Sandbox::apply : loan id mismatch, expected " +
                    std::to_string(c->loan.id) + " got " +
                    std::to_string(*id));
        }
        else if (auto const* f = std::get_if<Finalize>(&action))
        {
            check(
                f->status == LoanStatus::repaid ? to.markRepaid(f->id)
                                                : to.markDefaulted(f->id),
                f->id,
                "finalize");
        }
        else if (auto const* d = std::get_if<Disburse>(&action))
        {
            check(to.markDisbursed(d->id), d->id, "disburse");
        }
        else if (auto const* v = std::get_if<Verify>(&action))
        {
            to.setVerified(v->account, v->verified);
        }
    }

    actions_.clear();
    items_.clear();
    verified_.clear();
}

}  // namespace collat
