#ifndef LUNAR_TRACE_HPP
#define LUNAR_TRACE_HPP

#include "lunar_trace/core/common.hpp"
#include "lunar_trace/core/log_level.hpp"
#include "lunar_trace/core/errors.hpp"
#include "lunar_trace/core/exception_info.hpp"
#include "lunar_trace/core/value.hpp"
#include "lunar_trace/core/formatted_record.hpp"
#include "lunar_trace/contract/operation_spec.hpp"
#include "lunar_trace/contract/contract_builder.hpp"
#include "lunar_trace/compiler/template_validator.hpp"
#include "lunar_trace/compiler/parameter_classifier.hpp"
#include "lunar_trace/compiler/record_formatter.hpp"
#include "lunar_trace/compiler/compiled_contract.hpp"
#include "lunar_trace/registry/contract_registry.hpp"
#include "lunar_trace/sink/sink_adapter.hpp"
#include "lunar_trace/sink/severity.hpp"
#include "lunar_trace/sink/log_entry.hpp"
#include "lunar_trace/formatter/formatter_interface.hpp"
#include "lunar_trace/formatter/human_readable_formatter.hpp"
#include "lunar_trace/formatter/json_formatter.hpp"
#include "lunar_trace/transport/transport_interface.hpp"
#include "lunar_trace/transport/stdout_transport.hpp"
#include "lunar_trace/sink/sink_interface.hpp"
#include "lunar_trace/sink/console_sink.hpp"
#include "lunar_trace/sink/callback_sink.hpp"
#include "lunar_trace/sink/sink_backend.hpp"
#include "lunar_trace/activity.hpp"
#include "lunar_trace/tracing.hpp"
#include "lunar_trace/trace.hpp"

#endif // LUNAR_TRACE_HPP
