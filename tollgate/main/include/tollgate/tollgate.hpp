// tollgate Umbrella Header
//
// Include this single header to pull in the public request-processing core API:
//   - Exchange and attachments (Exchange, AttachmentKey, RequestData, ResponseData)
//   - Handler chain (Handler, ResponseCodeHandler, StatusPageHandler)
//   - Admission control (AdmissionController, AdmissionConfig, AdmissionStats)
//   - Managed units (ManagedUnit, Unit, UnitInvoker, InvocationResult)
//   - Dispatchers (Dispatcher, WorkerPool)
//
// Usage Example:
//    #include <tollgate/tollgate.hpp>
//    using namespace tollgate;
//    auto unit = std::make_shared<ManagedUnit>(UnitInfo{}.withName("hello"), [] { return std::make_unique<Hello>(); });
//    auto pool = std::make_shared<WorkerPool>(4);
//    AdmissionController controller(AdmissionConfig{}.withMaxConcurrentRequests(16),
//                                   std::make_shared<UnitInvoker>(unit), pool);
//    // for each exchange delivered by the transport:
//    executeHandler(controller, exchange);

#pragma once

// Exchange & handler chain
#include "tollgate/attachment-key.hpp"         // IWYU pragma: export
#include "tollgate/exchange-data.hpp"          // IWYU pragma: export
#include "tollgate/exchange.hpp"               // IWYU pragma: export
#include "tollgate/handler.hpp"                // IWYU pragma: export
#include "tollgate/http-status-code.hpp"       // IWYU pragma: export
#include "tollgate/response-code-handler.hpp"  // IWYU pragma: export
#include "tollgate/status-page-handler.hpp"    // IWYU pragma: export

// Dispatchers
#include "tollgate/dispatcher.hpp"   // IWYU pragma: export
#include "tollgate/worker-pool.hpp"  // IWYU pragma: export

// Admission control
#include "tollgate/admission-config.hpp"      // IWYU pragma: export
#include "tollgate/admission-controller.hpp"  // IWYU pragma: export
#include "tollgate/admission-stats.hpp"       // IWYU pragma: export

// Managed units
#include "tollgate/invocation-result.hpp"  // IWYU pragma: export
#include "tollgate/managed-unit.hpp"       // IWYU pragma: export
#include "tollgate/unit-info.hpp"          // IWYU pragma: export
#include "tollgate/unit-invoker.hpp"       // IWYU pragma: export
#include "tollgate/unit-stats.hpp"         // IWYU pragma: export
#include "tollgate/unit.hpp"               // IWYU pragma: export

// Errors
#include "tollgate/configuration-error.hpp"  // IWYU pragma: export
