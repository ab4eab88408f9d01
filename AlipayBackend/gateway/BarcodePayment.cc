#include "BarcodePayment.h"
#include "Constants.h"
#include "GatewayException.h"
#include <trantor/utils/Logger.h>

namespace alipay
{
namespace
{
bool isPending(const Notify &notify)
{
    return notify.code == constant::WAIT_USER_CODE ||
           notify.code == constant::UNKNOWN_CODE;
}
}  // namespace

BarcodePayment::BarcodePayment(const GatewayEngine &engine, PollPolicy policy)
    : engine_(engine), trade_(engine), policy_(std::move(policy))
{
}

PaymentOutcome BarcodePayment::build(Order order) const
{
    order.productCode = constant::FACE_TO_FACE_PAYMENT;
    if (order.scene.empty())
    {
        order.scene = constant::BAR_CODE;
    }
    order.validate();
    if (order.authCode.empty())
    {
        throw ValidationError("missing auth_code");
    }

    const auto data = engine_.assemble(constant::BARCODE, order.toBizContent());
    PaymentOutcome outcome;
    outcome.notify = engine_.submit(
        data, GatewayEngine::responseKeyFor(constant::BARCODE));

    if (outcome.notify.isSuccessCode())
    {
        return succeed(std::move(outcome));
    }

    if (outcome.notify.tradeNo.empty() || !isPending(outcome.notify))
    {
        outcome.message = outcome.notify.subMsg.empty()
                              ? outcome.notify.msg
                              : outcome.notify.subMsg;
        outcome.state = PaymentState::Failed;
        return fail(std::move(outcome));
    }

    LOG_INFO << "Barcode payment " << order.outTradeNo
             << " pending, polling trade " << outcome.notify.tradeNo;
    return pollQueryTradeState(outcome.notify.tradeNo);
}

PaymentOutcome BarcodePayment::pollQueryTradeState(
    const std::string &tradeNo) const
{
    PaymentOutcome outcome;
    outcome.state = PaymentState::Polling;

    Auxiliary auxiliary;
    auxiliary.tradeNo = tradeNo;
    for (int attempt = 1; attempt <= policy_.maxAttempts; ++attempt)
    {
        if (attempt > 1)
        {
            policy_.wait();
        }
        outcome.notify = trade_.query(auxiliary);
        outcome.queryAttempts = attempt;
        LOG_DEBUG << "Poll " << attempt << "/" << policy_.maxAttempts
                  << " trade " << tradeNo
                  << " status=" << outcome.notify.tradeStatus;
        if (outcome.notify.isSuccessPay())
        {
            return succeed(std::move(outcome));
        }
    }

    outcome.state = PaymentState::TimedOut;
    LOG_WARN << "Barcode payment " << tradeNo << " timed out after "
             << outcome.queryAttempts << " queries, cancelling";
    try
    {
        trade_.cancel(auxiliary);
    }
    catch (const GatewayException &e)
    {
        LOG_ERROR << "Cancel of timed out trade " << tradeNo
                  << " failed: " << e.what();
    }
    outcome.state = PaymentState::Cancelled;
    outcome.message = constant::PAYMENT_TIMED_OUT;
    return fail(std::move(outcome));
}

PaymentOutcome BarcodePayment::succeed(PaymentOutcome outcome) const
{
    outcome.state = PaymentState::Succeeded;
    if (succeedHandler_)
    {
        succeedHandler_(outcome.notify);
    }
    return outcome;
}

PaymentOutcome BarcodePayment::fail(PaymentOutcome outcome) const
{
    if (failedHandler_)
    {
        failedHandler_(outcome.notify, outcome.message);
    }
    return outcome;
}
}  // namespace alipay
