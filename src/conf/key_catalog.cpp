#include "conf/key_catalog.hpp"
#include "conf/pattern.hpp"

#include <algorithm>

namespace rmqconf {

namespace {
// Key shapes from the broker's Cuttlefish schema files (priv/*.schema).
// Schema variables ($name, $id, ...) are written as "*".
const std::vector<KnownKeyTemplate> g_known_keys = {
    // Listeners
    {"listeners.tcp", "Listeners"},
    {"listeners.tcp.*", "Listeners"},
    {"listeners.ssl", "Listeners"},
    {"listeners.ssl.*", "Listeners"},
    {"num_acceptors.ssl", "Listeners"},
    {"num_acceptors.tcp", "Listeners"},

    // Networking
    {"socket_writer.gc_threshold", "Networking"},
    {"handshake_timeout", "Networking"},
    {"reverse_dns_lookups", "Networking"},
    {"tcp_listen_options", "Networking"},
    {"tcp_listen_options.backlog", "Networking"},
    {"tcp_listen_options.nodelay", "Networking"},
    {"tcp_listen_options.buffer", "Networking"},
    {"tcp_listen_options.delay_send", "Networking"},
    {"tcp_listen_options.dontroute", "Networking"},
    {"tcp_listen_options.exit_on_close", "Networking"},
    {"tcp_listen_options.fd", "Networking"},
    {"tcp_listen_options.high_msgq_watermark", "Networking"},
    {"tcp_listen_options.high_watermark", "Networking"},
    {"tcp_listen_options.keepalive", "Networking"},
    {"tcp_listen_options.low_msgq_watermark", "Networking"},
    {"tcp_listen_options.low_watermark", "Networking"},
    {"tcp_listen_options.port", "Networking"},
    {"tcp_listen_options.priority", "Networking"},
    {"tcp_listen_options.recbuf", "Networking"},
    {"tcp_listen_options.send_timeout", "Networking"},
    {"tcp_listen_options.send_timeout_close", "Networking"},
    {"tcp_listen_options.sndbuf", "Networking"},
    {"tcp_listen_options.tos", "Networking"},
    {"tcp_listen_options.linger.on", "Networking"},
    {"tcp_listen_options.linger.timeout", "Networking"},

    // Erlang
    {"erlang.K", "Erlang"},

    // Definitions
    {"load_definitions", "Definitions"},
    {"definitions.local.path", "Definitions"},
    {"definitions.import_backend", "Definitions"},
    {"definitions.skip_if_unchanged", "Definitions"},
    {"definitions.hashing.algorithm", "Definitions"},
    {"definitions.https.url", "Definitions"},
    {"definitions.tls.verify", "Definitions"},
    {"definitions.tls.fail_if_no_peer_cert", "Definitions"},
    {"definitions.tls.cacertfile", "Definitions"},
    {"definitions.tls.certfile", "Definitions"},
    {"definitions.tls.cert", "Definitions"},
    {"definitions.tls.reuse_session", "Definitions"},
    {"definitions.tls.crl_check", "Definitions"},
    {"definitions.tls.depth", "Definitions"},
    {"definitions.tls.dh", "Definitions"},
    {"definitions.tls.keyfile", "Definitions"},
    {"definitions.tls.log_alert", "Definitions"},
    {"definitions.tls.password", "Definitions"},
    {"definitions.tls.secure_renegotiate", "Definitions"},
    {"definitions.tls.reuse_sessions", "Definitions"},
    {"definitions.tls.versions.*", "Definitions"},
    {"definitions.tls.ciphers.*", "Definitions"},
    {"definitions.tls.log_level", "Definitions"},

    // Loopback users
    {"loopback_users", "Loopback users"},
    {"loopback_users.*", "Loopback users"},

    // SSL
    {"ssl_allow_poodle_attack", "SSL"},
    {"ssl_options", "SSL"},
    {"ssl_options.verify", "SSL"},
    {"ssl_options.fail_if_no_peer_cert", "SSL"},
    {"ssl_options.cacertfile", "SSL"},
    {"ssl_options.certfile", "SSL"},
    {"ssl_options.cert", "SSL"},
    {"ssl_options.client_renegotiation", "SSL"},
    {"ssl_options.crl_check", "SSL"},
    {"ssl_options.crl_sources.*", "SSL"},
    {"ssl_options.crl_sources.*.timeout", "SSL"},
    {"ssl_options.crl_sources.*.path", "SSL"},
    {"ssl_options.depth", "SSL"},
    {"ssl_options.dh", "SSL"},
    {"ssl_options.dhfile", "SSL"},
    {"ssl_options.honor_cipher_order", "SSL"},
    {"ssl_options.honor_ecc_order", "SSL"},
    {"ssl_options.key.RSAPrivateKey", "SSL"},
    {"ssl_options.key.DSAPrivateKey", "SSL"},
    {"ssl_options.key.PrivateKeyInfo", "SSL"},
    {"ssl_options.keyfile", "SSL"},
    {"ssl_options.log_level", "SSL"},
    {"ssl_options.log_alert", "SSL"},
    {"ssl_options.password", "SSL"},
    {"ssl_options.psk_identity", "SSL"},
    {"ssl_options.reuse_sessions", "SSL"},
    {"ssl_options.secure_renegotiate", "SSL"},
    {"ssl_options.versions.*", "SSL"},
    {"ssl_options.ciphers.*", "SSL"},
    {"ssl_options.bypass_pem_cache", "SSL"},

    // Metadata store
    {"metadata_store.khepri.default_timeout", "Metadata store"},

    // Auth
    {"auth_mechanisms.*", "Auth"},
    {"auth_backends.*", "Auth"},
    {"auth_backends.*.authn", "Auth"},
    {"auth_backends.*.authz", "Auth"},
    {"ssl_cert_login_from", "Auth"},
    {"ssl_cert_login_san_type", "Auth"},
    {"ssl_cert_login_san_index", "Auth"},
    {"ssl_handshake_timeout", "Auth"},

    // Cluster
    {"cluster_name", "Cluster"},
    {"cluster_partition_handling", "Cluster"},
    {"cluster_partition_handling.pause_if_all_down.recover", "Cluster"},
    {"cluster_partition_handling.pause_if_all_down.nodes.*", "Cluster"},
    {"cluster_formation.peer_discovery_backend", "Cluster"},
    {"cluster_formation.node_type", "Cluster"},
    {"cluster_formation.registration.enabled", "Cluster"},
    {"cluster_formation.internal_lock_retries", "Cluster"},
    {"cluster_formation.lock_retry_limit", "Cluster"},
    {"cluster_formation.lock_retry_timeout", "Cluster"},
    {"cluster_formation.discovery_retry_limit", "Cluster"},
    {"cluster_formation.discovery_retry_interval", "Cluster"},
    {"cluster_formation.target_cluster_size_hint", "Cluster"},
    {"cluster_formation.classic_config.nodes.*", "Cluster"},
    {"cluster_formation.dns.hostname", "Cluster"},
    {"cluster_queue_limit", "Cluster"},
    {"cluster_keepalive_interval", "Cluster"},
    {"cluster_exchange_limit", "Cluster"},

    // Workers
    {"default_worker_pool_size", "Workers"},

    // Password
    {"password_hashing_module", "Password"},
    {"credential_validator.validation_backend", "Password"},
    {"credential_validator.min_length", "Password"},
    {"credential_validator.regexp", "Password"},

    // Defaults
    {"default_vhost", "Defaults"},
    {"default_user", "Defaults"},
    {"default_pass", "Defaults"},
    {"default_permissions.configure", "Defaults"},
    {"default_permissions.read", "Defaults"},
    {"default_permissions.write", "Defaults"},
    {"default_users.*.vhost_pattern", "Defaults"},
    {"default_users.*.password", "Defaults"},
    {"default_users.*.configure", "Defaults"},
    {"default_users.*.read", "Defaults"},
    {"default_users.*.write", "Defaults"},
    {"default_users.*.tags", "Defaults"},
    {"anonymous_login_user", "Defaults"},
    {"anonymous_login_pass", "Defaults"},
    {"default_user_tags.*", "Defaults"},

    // Policies
    {"default_policies.operator.*.vhost_pattern", "Policies"},
    {"default_policies.operator.*.queue_pattern", "Policies"},
    {"default_policies.operator.*.apply_to", "Policies"},
    {"default_policies.operator.*.expires", "Policies"},
    {"default_policies.operator.*.message_ttl", "Policies"},
    {"default_policies.operator.*.max_length", "Policies"},
    {"default_policies.operator.*.max_length_bytes", "Policies"},
    {"default_policies.operator.*.max_in_memory_bytes", "Policies"},
    {"default_policies.operator.*.max_in_memory_length", "Policies"},
    {"default_policies.operator.*.delivery_limit", "Policies"},
    {"default_policies.operator.*.classic_queues.ha_mode", "Policies"},
    {"default_policies.operator.*.classic_queues.ha_params", "Policies"},
    {"default_policies.operator.*.classic_queues.ha_sync_mode", "Policies"},
    {"default_policies.operator.*.classic_queues.queue_version", "Policies"},

    // Limits
    {"default_limits.vhosts.*.pattern", "Limits"},
    {"default_limits.vhosts.*.max_connections", "Limits"},
    {"default_limits.vhosts.*.max_queues", "Limits"},

    // Protocol
    {"heartbeat", "Protocol"},
    {"frame_max", "Protocol"},
    {"initial_frame_max", "Protocol"},
    {"channel_max", "Protocol"},
    {"channel_max_per_node", "Protocol"},
    {"consumer_max_per_channel", "Protocol"},
    {"session_max_per_connection", "Protocol"},
    {"link_max_per_session", "Protocol"},
    {"connection_max", "Protocol"},
    {"ranch_connection_max", "Protocol"},
    {"vhost_max", "Protocol"},
    {"max_message_size", "Protocol"},

    // Memory
    {"vm_memory_high_watermark.relative", "Memory"},
    {"vm_memory_high_watermark.absolute", "Memory"},
    {"vm_memory_high_watermark_paging_ratio", "Memory"},
    {"memory_monitor_interval", "Memory"},
    {"vm_memory_calculation_strategy", "Memory"},
    {"total_memory_available_override_value", "Memory"},

    // Disk
    {"disk_free_limit.relative", "Disk"},
    {"disk_free_limit.absolute", "Disk"},

    // Delegates
    {"delegate_count", "Delegates"},

    // Mirroring
    {"mirroring_sync_batch_size", "Mirroring"},
    {"mirroring_sync_max_throughput", "Mirroring"},

    // Queue
    {"queue_master_locator", "Queue"},
    {"queue_leader_locator", "Queue"},
    {"queue_index_embed_msgs_below", "Queue"},
    {"default_queue_type", "Queue"},

    // Classic queue
    {"classic_queue.default_version", "Classic queue"},
    {"queue_types.classic.enabled", "Classic queue"},
    {"queue_types.stream.enabled", "Classic queue"},
    {"queue_types.quorum.enabled", "Classic queue"},

    // Statistics
    {"collect_statistics", "Statistics"},
    {"collect_statistics_interval", "Statistics"},

    // Misc
    {"hipe_compile", "Misc"},
    {"mnesia_table_loading_retry_timeout", "Misc"},
    {"mnesia_table_loading_retry_limit", "Misc"},
    {"message_store_shutdown_timeout", "Misc"},
    {"background_gc_enabled", "Misc"},
    {"background_gc_target_interval", "Misc"},
    {"proxy_protocol", "Misc"},
    {"vhost_restart_strategy", "Misc"},
    {"consumer_timeout", "Misc"},
    {"product.name", "Misc"},
    {"product.version", "Misc"},
    {"motd_file", "Misc"},
    {"prevent_startup_if_node_was_reset", "Misc"},

    // Logging
    {"log.summarize_process_state", "Logging"},
    {"log.error_logger_format_depth", "Logging"},
    {"log.dir", "Logging"},
    {"log.console", "Logging"},
    {"log.console.level", "Logging"},
    {"log.console.stdio", "Logging"},
    {"log.console.use_colors", "Logging"},
    {"log.console.color_esc_seqs.debug", "Logging"},
    {"log.console.color_esc_seqs.info", "Logging"},
    {"log.console.color_esc_seqs.notice", "Logging"},
    {"log.console.color_esc_seqs.warning", "Logging"},
    {"log.console.color_esc_seqs.error", "Logging"},
    {"log.console.color_esc_seqs.critical", "Logging"},
    {"log.console.color_esc_seqs.alert", "Logging"},
    {"log.console.color_esc_seqs.emergency", "Logging"},
    {"log.console.formatter", "Logging"},
    {"log.console.formatter.time_format", "Logging"},
    {"log.console.formatter.level_format", "Logging"},
    {"log.console.formatter.single_line", "Logging"},
    {"log.console.formatter.plaintext.format", "Logging"},
    {"log.console.formatter.json.field_map", "Logging"},
    {"log.console.formatter.json.verbosity_map", "Logging"},
    {"log.exchange", "Logging"},
    {"log.exchange.level", "Logging"},
    {"log.exchange.formatter", "Logging"},
    {"log.exchange.formatter.time_format", "Logging"},
    {"log.exchange.formatter.level_format", "Logging"},
    {"log.exchange.formatter.single_line", "Logging"},
    {"log.exchange.formatter.plaintext.format", "Logging"},
    {"log.exchange.formatter.json.field_map", "Logging"},
    {"log.exchange.formatter.json.verbosity_map", "Logging"},
    {"log.journald", "Logging"},
    {"log.journald.level", "Logging"},
    {"log.journald.fields", "Logging"},
    {"log.syslog", "Logging"},
    {"log.syslog.level", "Logging"},
    {"log.syslog.formatter", "Logging"},
    {"log.syslog.formatter.time_format", "Logging"},
    {"log.syslog.formatter.level_format", "Logging"},
    {"log.syslog.formatter.single_line", "Logging"},
    {"log.syslog.formatter.plaintext.format", "Logging"},
    {"log.syslog.formatter.json.field_map", "Logging"},
    {"log.syslog.formatter.json.verbosity_map", "Logging"},
    {"log.syslog.identity", "Logging"},
    {"log.syslog.facility", "Logging"},
    {"log.syslog.multiline_mode", "Logging"},
    {"log.syslog.ip", "Logging"},
    {"log.syslog.host", "Logging"},
    {"log.syslog.port", "Logging"},
    {"log.syslog.transport", "Logging"},
    {"log.syslog.protocol", "Logging"},
    {"log.syslog.ssl_options.verify", "Logging"},
    {"log.syslog.ssl_options.fail_if_no_peer_cert", "Logging"},
    {"log.syslog.ssl_options.cacertfile", "Logging"},
    {"log.syslog.ssl_options.certfile", "Logging"},
    {"log.syslog.ssl_options.cert", "Logging"},
    {"log.syslog.ssl_options.client_renegotiation", "Logging"},
    {"log.syslog.ssl_options.crl_check", "Logging"},
    {"log.syslog.ssl_options.depth", "Logging"},
    {"log.syslog.ssl_options.dh", "Logging"},
    {"log.syslog.ssl_options.dhfile", "Logging"},
    {"log.syslog.ssl_options.honor_cipher_order", "Logging"},
    {"log.syslog.ssl_options.honor_ecc_order", "Logging"},
    {"log.syslog.ssl_options.key.RSAPrivateKey", "Logging"},
    {"log.syslog.ssl_options.key.DSAPrivateKey", "Logging"},
    {"log.syslog.ssl_options.key.PrivateKeyInfo", "Logging"},
    {"log.syslog.ssl_options.keyfile", "Logging"},
    {"log.syslog.ssl_options.log_alert", "Logging"},
    {"log.syslog.ssl_options.password", "Logging"},
    {"log.syslog.ssl_options.psk_identity", "Logging"},
    {"log.syslog.ssl_options.reuse_sessions", "Logging"},
    {"log.syslog.ssl_options.secure_renegotiate", "Logging"},
    {"log.syslog.ssl_options.versions.*", "Logging"},
    {"log.file", "Logging"},
    {"log.file.level", "Logging"},
    {"log.file.rotation.date", "Logging"},
    {"log.file.rotation.compress", "Logging"},
    {"log.file.rotation.size", "Logging"},
    {"log.file.rotation.count", "Logging"},
    {"log.file.formatter", "Logging"},
    {"log.file.formatter.time_format", "Logging"},
    {"log.file.formatter.level_format", "Logging"},
    {"log.file.formatter.single_line", "Logging"},
    {"log.file.formatter.plaintext.format", "Logging"},
    {"log.file.formatter.json.field_map", "Logging"},
    {"log.file.formatter.json.verbosity_map", "Logging"},
    {"log.connection.level", "Logging"},
    {"log.connection.file", "Logging"},
    {"log.connection.rotation.date", "Logging"},
    {"log.connection.rotation.compress", "Logging"},
    {"log.connection.rotation.size", "Logging"},
    {"log.connection.rotation.count", "Logging"},
    {"log.channel.level", "Logging"},
    {"log.channel.file", "Logging"},
    {"log.channel.rotation.date", "Logging"},
    {"log.channel.rotation.compress", "Logging"},
    {"log.channel.rotation.size", "Logging"},
    {"log.channel.rotation.count", "Logging"},
    {"log.mirroring.level", "Logging"},
    {"log.mirroring.file", "Logging"},
    {"log.mirroring.rotation.date", "Logging"},
    {"log.mirroring.rotation.compress", "Logging"},
    {"log.mirroring.rotation.size", "Logging"},
    {"log.mirroring.rotation.count", "Logging"},
    {"log.queue.level", "Logging"},
    {"log.queue.file", "Logging"},
    {"log.queue.rotation.date", "Logging"},
    {"log.queue.rotation.compress", "Logging"},
    {"log.queue.rotation.size", "Logging"},
    {"log.queue.rotation.count", "Logging"},
    {"log.federation.level", "Logging"},
    {"log.federation.file", "Logging"},
    {"log.federation.rotation.date", "Logging"},
    {"log.federation.rotation.compress", "Logging"},
    {"log.federation.rotation.size", "Logging"},
    {"log.federation.rotation.count", "Logging"},
    {"log.upgrade.level", "Logging"},
    {"log.upgrade.file", "Logging"},
    {"log.upgrade.rotation.date", "Logging"},
    {"log.upgrade.rotation.compress", "Logging"},
    {"log.upgrade.rotation.size", "Logging"},
    {"log.upgrade.rotation.count", "Logging"},
    {"log.ra.level", "Logging"},
    {"log.ra.file", "Logging"},
    {"log.ra.rotation.date", "Logging"},
    {"log.ra.rotation.compress", "Logging"},
    {"log.ra.rotation.size", "Logging"},
    {"log.ra.rotation.count", "Logging"},
    {"log.default.level", "Logging"},
    {"log.default.rotation.date", "Logging"},
    {"log.default.rotation.compress", "Logging"},
    {"log.default.rotation.size", "Logging"},
    {"log.default.rotation.count", "Logging"},

    // Network/distribution
    {"net_ticktime", "Network/distribution"},
    {"distribution.listener.port_range.min", "Network/distribution"},
    {"distribution.listener.port_range.max", "Network/distribution"},
    {"distribution.listener.interface", "Network/distribution"},

    // Sysmon
    {"sysmon_handler.thresholds.busy_processes", "Sysmon"},
    {"sysmon_handler.thresholds.busy_ports", "Sysmon"},
    {"sysmon_handler.triggers.process.garbage_collection", "Sysmon"},
    {"sysmon_handler.triggers.process.long_scheduled_execution", "Sysmon"},
    {"sysmon_handler.triggers.process.heap_size", "Sysmon"},
    {"sysmon_handler.triggers.port", "Sysmon"},
    {"sysmon_handler.triggers.distribution_port", "Sysmon"},

    // Raft
    {"raft.segment_max_entries", "Raft"},
    {"raft.wal_max_size_bytes", "Raft"},
    {"raft.wal_max_entries", "Raft"},
    {"raft.wal_hibernate_after", "Raft"},
    {"raft.wal_max_batch_size", "Raft"},
    {"raft.snapshot_chunk_size", "Raft"},
    {"raft.data_dir", "Raft"},
    {"raft.adaptive_failure_detector.poll_interval", "Raft"},

    // Exchange types
    {"exchange_types.local_random.enabled", "Exchange types"},

    // Quorum queues
    {"quorum_queue.compute_checksums", "Quorum queues"},
    {"quorum_queue.property_equivalence.relaxed_checks_on_redeclaration", "Quorum queues"},
    {"quorum_queue.initial_cluster_size", "Quorum queues"},
    {"quorum_queue.commands_soft_limit", "Quorum queues"},
    {"quorum_queue.continuous_membership_reconciliation.enabled", "Quorum queues"},
    {"quorum_queue.continuous_membership_reconciliation.auto_remove", "Quorum queues"},
    {"quorum_queue.continuous_membership_reconciliation.interval", "Quorum queues"},
    {"quorum_queue.continuous_membership_reconciliation.trigger_interval", "Quorum queues"},
    {"quorum_queue.continuous_membership_reconciliation.target_group_size", "Quorum queues"},

    // Runtime parameters
    {"runtime_parameters.limits.*", "Runtime parameters"},

    // Message interceptors
    {"message_interceptors.*.*.*", "Message interceptors"},

    // Streams
    {"stream.replication.address_family", "Streams"},
    {"stream.replication.port_range.min", "Streams"},
    {"stream.replication.port_range.max", "Streams"},
    {"stream.data_dir", "Streams"},
    {"stream.read_ahead", "Streams"},
    {"stream.read_ahead_limit", "Streams"},

    // Tags
    {"cluster_tags.*", "Tags"},
    {"node_tags.*", "Tags"},
};

bool is_valid_segment(std::string_view segment) {
    if (segment.empty()) {
        return false;
    }

    // Purely numeric segments are allowed, e.g. auth_backends.1
    if (std::all_of(segment.begin(), segment.end(), is_ascii_digit)) {
        return true;
    }

    char first = segment.front();
    if (!is_ascii_alpha(first) && first != '_') {
        return false;
    }
    return std::all_of(segment.begin() + 1, segment.end(), [](char c) {
        return is_ascii_alnum(c) || c == '_' || c == '-';
    });
}

}  // anonymous namespace

const std::vector<KnownKeyTemplate>& known_key_templates() {
    return g_known_keys;
}

bool is_valid_key_format(std::string_view key) {
    if (key.empty()) {
        return false;
    }
    auto segments = split_key(key);
    return std::all_of(segments.begin(), segments.end(), is_valid_segment);
}

bool is_known_key(std::string_view key) {
    return std::any_of(g_known_keys.begin(), g_known_keys.end(),
                       [key](const KnownKeyTemplate& t) { return matches(key, t.pattern); });
}

std::vector<std::string_view> suggest_similar_keys(std::string_view key) {
    std::string_view first = key.substr(0, key.find(KEY_SEPARATOR));

    std::vector<std::string_view> suggestions;
    for (const auto& t : g_known_keys) {
        if (suggestions.size() >= MAX_SUGGESTIONS) {
            break;
        }
        std::string_view template_first = t.pattern.substr(0, t.pattern.find(KEY_SEPARATOR));
        if (template_first == first || template_first == WILDCARD) {
            suggestions.push_back(t.pattern);
        }
    }
    return suggestions;
}

}  // namespace rmqconf
