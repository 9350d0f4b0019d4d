#include "../libinkpress/include/event_bus.hpp"
#include "../libinkpress/include/events.hpp"
#include <gtest/gtest.h>
#include <string>
#include <vector>

using namespace inkpress;

TEST(EventBusTest, DeliversOnlyToMatchingType) {
    EventBus bus;
    std::vector<PipelineStage> started;
    int completed = 0;
    bus.subscribe<StageStartEvent>([&](const StageStartEvent& e) { started.push_back(e.stage); });
    bus.subscribe<StageCompleteEvent>([&](const StageCompleteEvent&) { ++completed; });

    bus.publish(StageStartEvent{"a.epub", PipelineStage::Extract});
    bus.publish(StageStartEvent{"a.epub", PipelineStage::Repack});

    EXPECT_EQ(started, (std::vector<PipelineStage>{PipelineStage::Extract, PipelineStage::Repack}));
    EXPECT_EQ(completed, 0);
}

TEST(EventBusTest, HandlersRunInSubscriptionOrder) {
    EventBus bus;
    std::string order;
    bus.subscribe<WarningEvent>([&](const WarningEvent&) { order += "a"; });
    bus.subscribe<WarningEvent>([&](const WarningEvent&) { order += "b"; });
    bus.publish(WarningEvent{"a.epub", PipelineStage::StripImages, {WarningKind::Markup, "broken", "x.xhtml"}});
    EXPECT_EQ(order, "ab");
}

TEST(EventBusTest, UnsubscribeStopsDelivery) {
    EventBus bus;
    int calls = 0;
    const auto id = bus.subscribe<PipelineErrorEvent>([&](const PipelineErrorEvent&) { ++calls; });
    bus.publish(PipelineErrorEvent{"a.epub", PipelineStage::Validate, ErrorKind::InvalidInput, "missing"});
    bus.unsubscribe(id);
    bus.unsubscribe(id + 100);
    bus.publish(PipelineErrorEvent{"a.epub", PipelineStage::Validate, ErrorKind::InvalidInput, "missing"});
    EXPECT_EQ(calls, 1);
}

TEST(EventBusTest, HandlerMaySubscribeWhilePublishing) {
    EventBus bus;
    int late = 0;
    bus.subscribe<StageStartEvent>([&](const StageStartEvent&) {
        bus.subscribe<StageStartEvent>([&](const StageStartEvent&) { ++late; });
    });
    bus.publish(StageStartEvent{"a.epub", PipelineStage::Validate});
    EXPECT_EQ(late, 0);
    bus.publish(StageStartEvent{"a.epub", PipelineStage::Extract});
    EXPECT_EQ(late, 1);
}

TEST(EventBusTest, StageNames) {
    EXPECT_STREQ(stage_to_string(PipelineStage::Validate), "Validate");
    EXPECT_STREQ(stage_to_string(PipelineStage::ParseOPF), "ParseOPF");
    EXPECT_STREQ(stage_to_string(PipelineStage::Finalize), "Finalize");
}
