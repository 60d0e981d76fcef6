/* This file is part of Shipyard project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */

#include <condition_variable>
#include <cstring>
#include <mutex>
#include <shipyard/common/logger.hpp>
#include "channel.hpp"
#include "tls.hpp"
#include "internal/msquic.hpp"
#include "internal/stream-request.hpp"

namespace shipyard::replication {
    using namespace quic;

    namespace {
        struct quic_channel_t final: channel_t {
            explicit quic_channel_t(const transport_config_t &cfg):
                _cfg { cfg },
                _quic_cfg { cfg }
            {
            }

            ~quic_channel_t() override
            {
                logger::run_log_errors([&] {
                    shutdown(_cfg.shutdown_grace);
                });
                // ConnectionClose waits for the remaining callbacks to finish
                _conn.reset();
            }

            void download(const download_request_t &req, stream_observer_ptr_t obs) override
            {
                std::scoped_lock conn_lk { _conn_mutex };
                if (_shutdown) [[unlikely]]
                    throw transfer_error(fmt::format("{}: the channel to {} has been shut down", req, _cfg.peer));
                _ensure_connection();
                auto r = std::make_shared<stream_request_t>(req, std::move(obs), _cfg.max_inbound_message_size);
                auto st = std::make_unique<MsQuicStream>(*_conn, QUIC_STREAM_OPEN_FLAG_NONE, CleanUpAutoDelete, _stream_callback, r.get());
                if (!st->IsValid()) [[unlikely]]
                    throw transfer_error(status_message(fmt::format("{}: failed to open a stream", req), st->GetInitStatus()));
                r->self = r;
                const auto msg = req.encode();
                auto buf_scope = std::make_unique<QuicBufferScope>(static_cast<uint32_t>(msg.size()));
                memcpy(static_cast<QUIC_BUFFER *>(*buf_scope)->Buffer, msg.data(), msg.size());
                if (const auto res = st->Send(*buf_scope, 1, QUIC_SEND_FLAG_START | QUIC_SEND_FLAG_FIN, buf_scope.get()); QUIC_FAILED(res)) [[unlikely]] {
                    r->self.reset();
                    throw transfer_error(status_message(fmt::format("{}: failed to send the request", req), res));
                }
                // both are released by the stream callback
                buf_scope.release();
                st.release();
                logger::debug("{}: sent the request to {}", req, _cfg.peer);
            }

            void shutdown(const std::chrono::milliseconds grace) override
            {
                std::scoped_lock conn_lk { _conn_mutex };
                if (_shutdown)
                    return;
                _shutdown = true;
                if (!_conn)
                    return;
                logger::info("shutting down the connection to {}", _cfg.peer);
                _conn->Shutdown(app_error_none);
                std::unique_lock lk { _mutex };
                if (!_closed_cv.wait_for(lk, grace, [&] { return !_conn_alive; })) {
                    lk.unlock();
                    _conn->Shutdown(app_error_cancelled, QUIC_CONNECTION_SHUTDOWN_FLAG_SILENT);
                    throw shutdown_error(fmt::format("the connection to {} did not close within {} ms", _cfg.peer, grace.count()));
                }
                lk.unlock();
                _conn.reset();
                logger::info("the connection to {} has been closed", _cfg.peer);
            }
        private:
            const transport_config_t _cfg;
            api_initializer_t _init {};
            const client_config_t _quic_cfg;
            // serializes the connection setup and teardown; never taken by the msquic callbacks
            std::mutex _conn_mutex alignas(64U) {};
            std::mutex _mutex alignas(64U) {};
            std::condition_variable _closed_cv {};
            std::unique_ptr<MsQuicConnection> _conn {};
            bool _conn_alive = false;
            bool _shutdown = false;

            bool _connection_alive()
            {
                std::scoped_lock lk { _mutex };
                return _conn_alive;
            }

            // must be called with _conn_mutex held
            void _ensure_connection()
            {
                if (_conn && _connection_alive())
                    return;
                if (_conn) {
                    logger::info("the connection to {} was lost, reconnecting", _cfg.peer);
                    _conn.reset();
                }
                auto conn = std::make_unique<MsQuicConnection>(_quic_cfg.reg(), CleanUpManual, _connection_callback, this);
                if (!conn->IsValid()) [[unlikely]]
                    throw transfer_error(status_message("failed to initialize MsQuicConnection", conn->GetInitStatus()));
                const char *server_name = _cfg.peer.host.c_str();
                if (_cfg.security.enabled && _cfg.security.test_authority_override) {
                    QUIC_ADDR addr {};
                    if (!QuicAddrFromString(_cfg.peer.host.c_str(), _cfg.peer.port, &addr)) [[unlikely]]
                        throw transfer_error(fmt::format("can't parse the peer address {}", _cfg.peer));
                    if (const auto res = MsQuic->SetParam(*conn, QUIC_PARAM_CONN_REMOTE_ADDRESS, sizeof(addr), &addr); QUIC_FAILED(res)) [[unlikely]]
                        throw transfer_error(status_message(fmt::format("failed to set the remote address {}", _cfg.peer), res));
                    server_name = test_authority.data();
                }
                {
                    std::scoped_lock lk { _mutex };
                    _conn_alive = true;
                }
                _conn = std::move(conn);
                if (const auto res = _conn->Start(_quic_cfg.config(), QUIC_ADDRESS_FAMILY_UNSPEC, server_name, _cfg.peer.port); QUIC_FAILED(res)) [[unlikely]] {
                    {
                        std::scoped_lock lk { _mutex };
                        _conn_alive = false;
                    }
                    throw transfer_error(status_message(fmt::format("failed to start a connection to {}", _cfg.peer), res));
                }
                logger::info("connecting to {} as {}", _cfg.peer, server_name);
            }

            static QUIC_STATUS QUIC_API _connection_callback(MsQuicConnection *, void *ctx, QUIC_CONNECTION_EVENT *event)
            {
                if (!ctx) [[unlikely]] {
                    logger::error("quic_channel: connection context cannot be nullptr!");
                    return QUIC_STATUS_SUCCESS;
                }
                auto &self = *reinterpret_cast<quic_channel_t *>(ctx);
                switch (event->Type) {
                    case QUIC_CONNECTION_EVENT_CONNECTED:
                        logger::info("connected to {}", self._cfg.peer);
                        break;
                    case QUIC_CONNECTION_EVENT_PEER_CERTIFICATE_RECEIVED:
                        logger::info("peer {} presented {}", self._cfg.peer,
                            tls::describe_cert(reinterpret_cast<const X509 *>(event->PEER_CERTIFICATE_RECEIVED.Certificate)));
                        break;
                    case QUIC_CONNECTION_EVENT_SHUTDOWN_INITIATED_BY_TRANSPORT:
                        logger::warn("connection to {}: shut down by transport: error code: {:08X} status: {}", self._cfg.peer,
                            event->SHUTDOWN_INITIATED_BY_TRANSPORT.ErrorCode, status_name(event->SHUTDOWN_INITIATED_BY_TRANSPORT.Status));
                        break;
                    case QUIC_CONNECTION_EVENT_SHUTDOWN_INITIATED_BY_PEER:
                        logger::info("connection to {}: shut down by peer: error code: {}", self._cfg.peer,
                            event->SHUTDOWN_INITIATED_BY_PEER.ErrorCode);
                        break;
                    case QUIC_CONNECTION_EVENT_SHUTDOWN_COMPLETE: {
                        logger::debug("connection to {}: shutdown complete", self._cfg.peer);
                        {
                            std::scoped_lock lk { self._mutex };
                            self._conn_alive = false;
                        }
                        self._closed_cv.notify_all();
                        break;
                    }
                    default:
                        logger::trace("connection to {}: event: {}", self._cfg.peer, static_cast<int>(event->Type));
                        break;
                }
                return QUIC_STATUS_SUCCESS;
            }

            static QUIC_STATUS QUIC_API _stream_callback(MsQuicStream *stream, void *ctx, QUIC_STREAM_EVENT *event)
            {
                if (!ctx) [[unlikely]] {
                    logger::error("quic_channel: stream context cannot be nullptr!");
                    return QUIC_STATUS_SUCCESS;
                }
                auto &req = *reinterpret_cast<stream_request_t *>(ctx);
                switch (event->Type) {
                    case QUIC_STREAM_EVENT_START_COMPLETE:
                        if (QUIC_FAILED(event->START_COMPLETE.Status)) [[unlikely]]
                            req.fail(std::make_exception_ptr(transfer_error(status_message(fmt::format("{}: the stream failed to start", req.request()), event->START_COMPLETE.Status))));
                        else
                            logger::debug("{}: stream started", req.request());
                        break;
                    case QUIC_STREAM_EVENT_SEND_COMPLETE:
                        delete reinterpret_cast<QuicBufferScope *>(event->SEND_COMPLETE.ClientContext);
                        break;
                    case QUIC_STREAM_EVENT_RECEIVE:
                        for (decltype(event->RECEIVE.BufferCount) bi = 0; bi < event->RECEIVE.BufferCount; ++bi) {
                            const QUIC_BUFFER *buf = event->RECEIVE.Buffers + bi;
                            if (!req.on_receive(buffer { buf->Buffer, buf->Length })) {
                                stream->Shutdown(app_error_cancelled, QUIC_STREAM_SHUTDOWN_FLAG_ABORT);
                                break;
                            }
                        }
                        break;
                    case QUIC_STREAM_EVENT_PEER_SEND_SHUTDOWN:
                        req.on_peer_finished();
                        break;
                    case QUIC_STREAM_EVENT_PEER_SEND_ABORTED:
                        req.on_peer_aborted(event->PEER_SEND_ABORTED.ErrorCode);
                        break;
                    case QUIC_STREAM_EVENT_SHUTDOWN_COMPLETE: {
                        req.on_closed(event->SHUTDOWN_COMPLETE.ConnectionShutdown);
                        logger::debug("{}: stream closed", req.request());
                        // req may be destroyed together with the last reference
                        [[maybe_unused]] const auto last_ref = std::move(req.self);
                        break;
                    }
                    default:
                        logger::trace("{}: stream event: {}", req.request(), static_cast<int>(event->Type));
                        break;
                }
                return QUIC_STATUS_SUCCESS;
            }
        };
    }

    channel_ptr_t make_channel(const transport_config_t &cfg)
    {
        cfg.validate();
        tls::check_material(cfg.security);
        logger::info("creating a replication channel to {}: security: {} environment: {} alpn: {}",
            cfg.peer, cfg.security.enabled, cfg.environment, cfg.alpn);
        return std::make_unique<quic_channel_t>(cfg);
    }
}
