#include "util/flags.hpp"

DEFINE_string(backend, "auto",
              "Execution backend: docker, kubernetes or auto. auto picks "
              "kubernetes when running inside a cluster");
DEFINE_string(image, "python:3.12-slim", "Image used for execution units");
DEFINE_string(command, "python,-c",
              "Comma-separated command prefix; the code is appended as the "
              "last argument");

DEFINE_string(docker_endpoint, "unix:///var/run/docker.sock",
              "Docker Engine endpoint, unix://path or tcp://host:port");
DEFINE_int32(http_timeout_seconds, 60,
             "Timeout for Docker Engine requests other than wait");

DEFINE_string(k8s_namespace, "default", "Namespace where jobs are created");
DEFINE_int32(k8s_job_ttl, 300,
             "Seconds a finished job is kept before the cluster removes it");
DEFINE_string(kubeconfig, "",
              "Kubeconfig used outside the cluster. If unset, KUBECONFIG or "
              "the kubectl default is used");
DEFINE_string(kube_context, "", "Kubeconfig context to use");
DEFINE_string(kubectl, "kubectl", "kubectl binary");
DEFINE_int32(poll_interval_millis, 1000, "Job status polling interval");
