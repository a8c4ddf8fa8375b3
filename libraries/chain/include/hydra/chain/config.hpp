#pragma once

#define HYDRA_ADDRESS_PREFIX "HYD"

#define HYDRA_MAX_DEPTH 5
#define HYDRA_MAX_NAME_LENGTH 32
#define HYDRA_MAX_SPECIALIZATION_LENGTH 64
#define HYDRA_MAX_REVENUE_SHARE_BPS 10000 /* 100% */

#define HYDRA_REGISTRY_SEED "registry"
#define HYDRA_AGENT_SEED "agent"

/** default number of agents or events returned by a single listing call */
#define HYDRA_DEFAULT_QUERY_LIMIT 100
#define HYDRA_MAX_QUERY_LIMIT 1000
