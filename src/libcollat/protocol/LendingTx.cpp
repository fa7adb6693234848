#include <collat/protocol/LendingTx.h>

namespace collat {

std::string
to_string(TxType type)
{
    switch (type)
    {
        case ttACCOUNT_VERIFY:
            return "AccountVerify";
        case ttLOAN_REQUEST:
            return "LoanRequest";
        case ttLOAN_APPROVE:
            return "LoanApprove";
        case ttLOAN_REPAY:
            return "LoanRepay";
        case ttLOAN_DEFAULT:
            return "LoanDefault";
    }
    return "Unknown";
}

}  // namespace collat
