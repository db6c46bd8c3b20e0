#ifndef UTIL_FLAGS_HPP
#define UTIL_FLAGS_HPP

#include "gflags/gflags.h"

// Backend selection
DECLARE_string(backend);
DECLARE_string(image);
DECLARE_string(command);

// Docker backend
DECLARE_string(docker_endpoint);
DECLARE_int32(http_timeout_seconds);

// Kubernetes backend
DECLARE_string(k8s_namespace);
DECLARE_int32(k8s_job_ttl);
DECLARE_string(kubeconfig);
DECLARE_string(kube_context);
DECLARE_string(kubectl);
DECLARE_int32(poll_interval_millis);

#endif
