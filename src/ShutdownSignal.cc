#include "ShutdownSignal.hh"
#include "Logger.hh"

#include <csignal>

ShutdownSignal::ShutdownSignal(CancellationToken &cancelToken)
    : token(cancelToken),
      io_context(),
      work_guard(asio::make_work_guard(io_context)),
      signals(io_context, SIGINT, SIGTERM)
{
    arm();
    worker_thread = std::thread([this]()
                                { io_context.run(); });
}

ShutdownSignal::~ShutdownSignal()
{
    asio::error_code ignored;
    signals.cancel(ignored);

    work_guard.reset();
    io_context.stop();

    if (worker_thread.joinable())
        worker_thread.join();
}

void ShutdownSignal::arm()
{
    signals.async_wait([this](const asio::error_code &ec, int signalNumber)
                       {
        // operation_aborted: torn down without a signal
        if (ec)
            return;

        received = signalNumber;
        Logger::dualSafeLog(string("Received ") + (signalNumber == SIGINT ? "SIGINT" : "SIGTERM") + ", cancelling remaining tasks...");
        token.cancel();

        // A second signal is still observed, cancellation is idempotent
        arm(); });
}
