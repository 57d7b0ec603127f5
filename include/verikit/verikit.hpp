#pragma once

#include "verikit/api/factory.hpp"
#include "verikit/api/status.hpp"
#include "verikit/api/version.hpp"
#include "verikit/config/run_config.hpp"
#include "verikit/config/task_catalog.hpp"
#include "verikit/json/json_codec.hpp"
#include "verikit/log/ilog_manager.hpp"
#include "verikit/log/log_manager.hpp"
#include "verikit/log/log_types.hpp"
#include "verikit/report/i_reporter.hpp"
#include "verikit/report/json_summary_reporter.hpp"
#include "verikit/task/dependency_resolver.hpp"
#include "verikit/task/i_verifier.hpp"
#include "verikit/task/result_aggregator.hpp"
#include "verikit/task/scheduler.hpp"
#include "verikit/task/task_executor.hpp"
#include "verikit/task/task_graph.hpp"
#include "verikit/task/task_types.hpp"
#include "verikit/verifier/process_verifier.hpp"
