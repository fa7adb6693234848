#include <collatd/app/tx/detail/ApplyContext.h>

#include <collat/basics/Log.h>

#include <exception>

namespace collat {

ApplyContext::ApplyContext(
    ServiceRegistry& registry_,
    ReadView const& base,
    LendingTx const& tx_,
    NetClock::time_point now_,
    Journal journal_)
    : registry(registry_)
    , tx(tx_)
    , now(now_)
    , journal(journal_)
    , view_(base)
{
}

void
ApplyContext::apply(ApplyView& base)
{
    if (!view_.empty())
        view_.apply(base);
    compensations_.clear();
}

TER
ApplyContext::discard()
{
    TER result = tesSUCCESS;

    for (auto iter = compensations_.rbegin(); iter != compensations_.rend();
         ++iter)
    {
        TER ter;
        try
        {
            ter = (*iter)();
        }
        catch (std::exception const& e)
        {
            JLOG(journal.fatal()) << "Rollback threw: " << e.what();
            ter = tefEXCEPTION;
        }

        if (!isTesSuccess(ter))
        {
            JLOG(journal.fatal())
                << "Unable to roll back " << to_string(tx.type) << ": "
                << transHuman(ter);
            result = tefBAD_LEDGER;
        }
    }

    compensations_.clear();
    events_.clear();
    createdLoanID = 0;
    return result;
}

}  // namespace collat
