#pragma once

// ── Working disk ────────────────────────────────────────────
// Every action mounts the same data disk; file parameters live under it.
constexpr const char* DATA_DISK_NAME  = "minsubdisk";
constexpr const char* DATA_DISK_MOUNT = "/mnt/data";

// ── Timeouts (pipelines duration strings) ───────────────────
constexpr const char* ONE_HOUR   = "3600s";
constexpr const char* TWO_HOURS  = "7200s";
constexpr const char* ONE_DAY    = "86400s";
constexpr const char* SEVEN_DAYS = "604800s";

// ── Default resource values ─────────────────────────────────
constexpr int DEFAULT_DISK_SIZE_GB          = 200;
constexpr const char* DEFAULT_MACHINE_TYPE  = "n1-standard-2";
constexpr const char* DEFAULT_SCOPE         = "https://www.googleapis.com/auth/cloud-platform";

// ── Images ──────────────────────────────────────────────────
// Generic tags are usually cached by the service, which makes them faster to
// pull than pinned versions.
constexpr const char* DEBIAN_IMAGE    = "debian:stable-slim";
constexpr const char* CLOUD_SDK_IMAGE = "google/cloud-sdk:slim";
constexpr const char* BASH_ENTRYPOINT = "/bin/bash";

// ── Action names ────────────────────────────────────────────
constexpr const char* LOCALIZE_ACTION_NAME   = "localize";
constexpr const char* DELOCALIZE_ACTION_NAME = "delocalize";
constexpr const char* USER_ACTION_PREFIX     = "user-action-";

// ── Parameter naming ────────────────────────────────────────
constexpr const char* AUTO_PREFIX_INPUT  = "INPUT_";
constexpr const char* AUTO_PREFIX_OUTPUT = "OUTPUT_";

// ── Storage providers ───────────────────────────────────────
constexpr const char* GCS_SCHEME        = "gs://";
constexpr const char* GCS_DOCKER_PREFIX = "gs/";
constexpr const char* LOCAL_DOCKER_PREFIX = "file/";
constexpr const char* DOTDOT_TOKEN      = "_dotdot_";
constexpr const char* HOME_TOKEN        = "_home_";

// ── Request labels ──────────────────────────────────────────
constexpr const char* LABEL_KEY   = "minsub";
constexpr const char* LABEL_VALUE = "v1";

// ── Local files ─────────────────────────────────────────────
constexpr const char* JOB_FILE_NAME      = "minsub.yaml";
constexpr const char* GLOBAL_CONFIG_DIR  = ".minsub";
constexpr const char* GLOBAL_CONFIG_FILE = "config.yaml";
constexpr const char* DEBUG_LOG_FILE     = "minsub_debug.log";

constexpr const char* MINSUB_VERSION = "0.1.0";
