#pragma once

#include "GatewayEngine.h"
#include "Notify.h"
#include "Order.h"
#include "PollPolicy.h"
#include "TradeService.h"
#include <functional>
#include <string>

namespace alipay
{
enum class PaymentState
{
    Submitted,
    Polling,
    Succeeded,
    TimedOut,
    Cancelled,
    Failed
};

struct PaymentOutcome
{
    PaymentState state{PaymentState::Submitted};
    std::string message;
    Notify notify;
    int queryAttempts{0};

    bool succeeded() const
    {
        return state == PaymentState::Succeeded;
    }
};

class BarcodePayment
{
  public:
    using SucceedHandler = std::function<void(const Notify &)>;
    using FailedHandler =
        std::function<void(const Notify &, const std::string &message)>;

    explicit BarcodePayment(const GatewayEngine &engine,
                            PollPolicy policy = PollPolicy());

    void onPaymentSucceed(SucceedHandler handler)
    {
        succeedHandler_ = std::move(handler);
    }
    void onPaymentFailed(FailedHandler handler)
    {
        failedHandler_ = std::move(handler);
    }

    // Query failures propagate and do not count as an attempt.
    PaymentOutcome build(Order order) const;

  private:
    PaymentOutcome pollQueryTradeState(const std::string &tradeNo) const;
    PaymentOutcome succeed(PaymentOutcome outcome) const;
    PaymentOutcome fail(PaymentOutcome outcome) const;

    const GatewayEngine &engine_;
    TradeService trade_;
    PollPolicy policy_;
    SucceedHandler succeedHandler_;
    FailedHandler failedHandler_;
};
}  // namespace alipay
