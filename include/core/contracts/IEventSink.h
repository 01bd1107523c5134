#pragma once

#include "core/model/PipelineEvent.h"

namespace pricelens {
namespace core {

// 파이프라인 이벤트 수신자 (생성자 주입)
class IEventSink {
public:
    virtual ~IEventSink() = default;

    virtual void publish(PipelineEvent event) = 0;
};

} // namespace core
} // namespace pricelens
