#pragma once

// ── Build-time defaults ─────────────────────────────────────
// Overridable at configure time: cmake -DASPECT_REMOTE=... -DASPECT_CREDENTIAL_HELPER=...
#ifndef ASPECT_REAUTH_DEFAULT_REMOTE
#  define ASPECT_REAUTH_DEFAULT_REMOTE "aw-remote-ext.buildremote.stairwell.io"
#endif
#ifndef ASPECT_REAUTH_DEFAULT_HELPER
#  define ASPECT_REAUTH_DEFAULT_HELPER "aspect-credential-helper"
#endif
#ifndef ASPECT_REAUTH_VERSION
#  define ASPECT_REAUTH_VERSION "0.0.0"
#endif

constexpr const char* DEFAULT_REMOTE            = ASPECT_REAUTH_DEFAULT_REMOTE;
constexpr const char* DEFAULT_CREDENTIAL_HELPER = ASPECT_REAUTH_DEFAULT_HELPER;
constexpr const char* DEFAULT_HOST              = "devbox";

// Environment variables consulted after the config file, before the command line.
constexpr const char* ENV_REMOTE            = "ASPECT_REMOTE";
constexpr const char* ENV_CREDENTIAL_HELPER = "ASPECT_CREDENTIAL_HELPER";

// ── Keychain / keyring naming ───────────────────────────────
// Remote key name is "<prefix>:<remote>@<service>", matching what keyring-rs
// writes on Linux so both tools see the same key.
constexpr const char* DEFAULT_KEYCHAIN_SERVICE = "AspectWorkflows";
constexpr const char* DEFAULT_KEY_PREFIX       = "keyring-rs";
constexpr const char* USER_KEYRING             = "@u";
constexpr const char* SESSION_KEYRING          = "@s";

// ── SSH ─────────────────────────────────────────────────────
constexpr const char* DEFAULT_SSH_PROGRAM  = "ssh";
constexpr const char* SOCKET_DIR_PREFIX    = "aspect-reauth-";
constexpr const char* SOCKET_FILE_NAME     = "sock";

// Restrictive options applied to every batch command (cf. scp.c in openssh-portable).
constexpr const char* SSH_BATCH_OPTS[] = {
    "-oPermitLocalCommand=no",
    "-oClearAllForwardings=yes",
    "-oRemoteCommand=none",
    "-oForwardAgent=no",
    "-oBatchMode=yes",
};

// ── Logging ─────────────────────────────────────────────────
constexpr int LOG_STDERR_PREVIEW_BYTES = 500;

// ── Buffer sizes ────────────────────────────────────────────
constexpr int PROCESS_READ_BUF_SIZE = 16384;
