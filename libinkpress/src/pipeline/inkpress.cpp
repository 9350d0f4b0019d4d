/**
 * @file inkpress.cpp
 * @brief Implementation of the public Inkpress API.
 */

#include "../../include/inkpress.hpp"
#include "../../include/event_bus.hpp"
#include "../../include/events.hpp"
#include "../../include/log_sink.hpp"
#include "../../include/logger.hpp"
#include <atomic>

namespace inkpress {

namespace {

// shared between an Inkpress instance and its log sink
using ObserverSlot = std::shared_ptr<std::atomic<InkpressObserver*>>;

// bridge sink to redirect static logs to the instance observer
class BridgeLogSink final : public ILogSink {
    ObserverSlot slot_;
public:
    explicit BridgeLogSink(ObserverSlot slot) : slot_(std::move(slot)) {}

    void log(const LogLevel level, const std::string_view message, const std::string_view tag) override {
        if (auto* observer = slot_->load()) {
            observer->onLog(static_cast<int>(level), std::string(message), std::string(tag));
        }
    }
};

} // namespace

struct Inkpress::Impl {
    EventBus eventBus;
    PipelineOptions options;
    ObserverSlot observer = std::make_shared<std::atomic<InkpressObserver*>>(nullptr);
    const ILogSink* bridge = nullptr; ///< owned by Logger

    Impl() {
        options.provenance = Provenance::from_environment();
        setupEventBridging();
    }

    ~Impl() {
        observer->store(nullptr);
        if (bridge) Logger::remove_sink(bridge);
    }

    void setupEventBridging() {
        eventBus.subscribe<StageStartEvent>([slot = observer](const StageStartEvent& e) {
            if (auto* o = slot->load()) o->onStageStart(e.input, stage_to_string(e.stage));
        });

        eventBus.subscribe<WarningEvent>([slot = observer](const WarningEvent& e) {
            if (auto* o = slot->load()) {
                o->onWarning(e.input, warning_kind_to_string(e.warning.kind), e.warning.message);
            }
        });

        eventBus.subscribe<PipelineCompleteEvent>([slot = observer](const PipelineCompleteEvent& e) {
            if (auto* o = slot->load()) o->onFinish(e.input, e.output, e.input_size, e.output_size);
        });

        eventBus.subscribe<PipelineErrorEvent>([slot = observer](const PipelineErrorEvent& e) {
            if (auto* o = slot->load()) o->onError(e.input, e.error_message);
        });
    }
};

Inkpress::Inkpress() : impl_(std::make_unique<Impl>()) {}

Inkpress::~Inkpress() = default;

Inkpress::Inkpress(Inkpress&&) noexcept = default;
Inkpress& Inkpress::operator=(Inkpress&&) noexcept = default;

Inkpress& Inkpress::maxTitleLength(const std::size_t val) {
    impl_->options.max_title_length = val;
    return *this;
}

Inkpress& Inkpress::skipPages(const std::size_t val) {
    impl_->options.skip_leading_pages = val;
    return *this;
}

Inkpress& Inkpress::stylesheet(const std::filesystem::path& css) {
    if (css.empty()) {
        impl_->options.stylesheet.reset();
    } else {
        impl_->options.stylesheet = css;
    }
    return *this;
}

Inkpress& Inkpress::stripImages(const bool val) {
    impl_->options.strip_images = val;
    return *this;
}

Inkpress& Inkpress::debug(const bool val) {
    impl_->options.debug = val;
    return *this;
}

Inkpress& Inkpress::provenance(const std::string& workflow_run_id, const std::string& git_sha) {
    if (!workflow_run_id.empty()) impl_->options.provenance.workflow_run_id = workflow_run_id;
    if (!git_sha.empty()) impl_->options.provenance.git_sha = git_sha;
    return *this;
}

const PipelineOptions& Inkpress::options() const noexcept {
    return impl_->options;
}

void Inkpress::setObserver(InkpressObserver* observer) {
    impl_->observer->store(observer);
    // one bridge per instance, removed with it
    if (observer && !impl_->bridge) {
        auto sink = std::make_unique<BridgeLogSink>(impl_->observer);
        impl_->bridge = sink.get();
        Logger::add_sink(std::move(sink));
    }
}

ProcessResult Inkpress::process(const std::filesystem::path& input, const std::filesystem::path& output) {
    EpubPipeline pipeline(impl_->options, impl_->eventBus);
    return pipeline.process(input, output);
}

} // namespace inkpress
