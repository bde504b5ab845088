/*
 * Copyright (C) 2025 Dan Arrhenius <dan@ultramarin.se>
 *
 * This file is part of libtftpio
 *
 * libtftpio is free software; you can redistribute it and/or modify it
 * under the terms of the GNU General Public License as published
 * by the Free Software Foundation, either version 2 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program. If not, see <http://www.gnu.org/licenses/>.
 */
#ifndef TFTPIO_SESSION_HPP
#define TFTPIO_SESSION_HPP

#include <tftpio/packet.hpp>
#include <tftpio/options.hpp>
#include <tftpio/window.hpp>
#include <tftpio/transport.hpp>
#include <tftpio/file_io.hpp>
#include <tftpio/ip_addr.hpp>
#include <functional>
#include <chrono>
#include <string>
#include <vector>
#include <cstdint>


namespace tftpio {


    /**
     * State of a transfer session.
     */
    enum class transfer_state_t {
        negotiating,
        transferring,
        completed,
        failed
    };

    /**
     * Reason of a failed transfer.
     */
    enum class error_kind_t {
        none,
        malformed_packet,
        protocol_violation,
        negotiation_failed,
        timeout,
        retries_exhausted,
        peer_error,
        io_error,
        cancelled
    };

    const char* to_string (transfer_state_t state);
    const char* to_string (error_kind_t kind);


    /**
     * The outcome of a transfer.
     */
    struct transfer_result_t {
        transfer_result_t ();

        bool ok () const {
            return state == transfer_state_t::completed;
        }

        transfer_state_t state;
        error_kind_t error;
        uint16_t tftp_code;  /**< TFTP error code sent or received. */
        std::string message; /**< Error message sent or received. */
        uint64_t bytes;      /**< Number of bytes transferred. */
    };


    enum session_event_t {
        event_started,   /**< Negotiation is done and the transfer started. */
        event_completed,
        event_failed
    };

    class session;

    /**
     * Callback for session events.
     * Called from the thread running the session.
     */
    using session_observer_t = std::function<void (const session& sess,
                                                   session_event_t event,
                                                   const transfer_result_t& result)>;


    /**
     * Linger for twice the retransmission timeout of the session.
     */
    static constexpr unsigned linger_auto = (unsigned) -1;


    /**
     * Session configuration.
     */
    struct session_config_t {
        session_config_t ();

        /**
         * Max number of transmissions of a packet before
         * the session fails. Default 6.
         */
        unsigned max_retries;

        /**
         * Retransmission timeout in milliseconds, used when
         * no timeout option is negotiated. Default 5000.
         */
        unsigned timeout;

        /**
         * Block number after 65535. A sender with rollover_dont_care
         * uses block 0. Default rollover_dont_care.
         */
        rollover_t rollover;

        /**
         * Send each packet this many extra times. Default 0.
         */
        unsigned repeat_count;

        /**
         * Max number of bytes to receive, 0 means no limit. Default 0.
         */
        uint64_t max_write_size;

        /**
         * Discard the data sink if a receive fails. Default <code>true</code>.
         */
        bool clean_on_error;

        /**
         * Time in milliseconds to keep answering retransmissions of
         * the final DATA block after it is acknowledged, 0 disables it.
         * Default linger_auto, twice the retransmission timeout.
         */
        unsigned linger;

        session_observer_t observer;
    };


    /**
     * One TFTP transfer, as client or server.
     *
     * A session runs a single transfer to completion in the
     * calling thread. The transfer is driven by received
     * packets and timeouts of a deadline bounded receive on
     * the transport. Method cancel() may be called from
     * another thread to end the transfer.
     */
    class session {
    public:
        session (transport& tr, const session_config_t& config=session_config_t());
        ~session () = default;

        /**
         * Serve a read request (RRQ).
         * @param peer The client address.
         * @param filename The requested file name, used for logging.
         * @param src The file to send.
         * @param requested The options in the request.
         * @param policy Option negotiation policy.
         */
        transfer_result_t serve_read (const ip_addr& peer,
                                      const std::string& filename,
                                      data_source& src,
                                      const option_list& requested,
                                      const option_policy_t& policy);

        /**
         * Serve a write request (WRQ).
         * @param peer The client address.
         * @param filename The requested file name, used for logging.
         * @param sink Where to store the received file.
         * @param requested The options in the request.
         * @param policy Option negotiation policy.
         */
        transfer_result_t serve_write (const ip_addr& peer,
                                       const std::string& filename,
                                       data_sink& sink,
                                       const option_list& requested,
                                       const option_policy_t& policy);

        /**
         * Download a file from a server.
         * @param server The server address, the port is the request port.
         * @param filename The remote file name.
         * @param mode Transfer mode, "octet" or "netascii".
         * @param options Options to request, may be empty.
         * @param sink Where to store the received file.
         */
        transfer_result_t request_read (const ip_addr& server,
                                        const std::string& filename,
                                        const std::string& mode,
                                        const option_list& options,
                                        data_sink& sink);

        /**
         * Upload a file to a server.
         * @param server The server address, the port is the request port.
         * @param filename The remote file name.
         * @param mode Transfer mode, "octet" or "netascii".
         * @param options Options to request, may be empty.
         * @param src The file to send.
         */
        transfer_result_t request_write (const ip_addr& server,
                                         const std::string& filename,
                                         const std::string& mode,
                                         const option_list& options,
                                         data_source& src);

        /**
         * Cancel the session.
         * May be called from any thread.
         */
        void cancel ();

        transfer_state_t state () const {
            return st;
        }

        /**
         * The transfer parameters in use.
         */
        const transfer_params_t& params () const {
            return prm;
        }

        const ip_addr& peer () const {
            return peer_addr;
        }

        /**
         * Session identifier, "local_port:peer_address:peer_port".
         */
        const std::string& id () const {
            return sess_id;
        }

        const std::string& filename () const {
            return file_name;
        }

        /**
         * <code>true</code> for a read request, <code>false</code> for a write request.
         */
        bool is_read () const {
            return read_request;
        }


    private:
        enum wait_result_t {
            wait_ok,
            wait_timeout,
            wait_cancelled,
            wait_error
        };

        session (const session&) = delete;
        session& operator= (const session&) = delete;

        void begin (const ip_addr& peer, bool peer_is_fixed, const std::string& filename, bool is_rrq);
        void set_state (transfer_state_t state);
        void update_id ();
        void use_local_timeout (const option_list& negotiated);

        int send_buf (const std::vector<char>& buf);
        int send_packet (const packet& pkt);
        bool send_window_blocks (const send_window& win, transfer_result_t& result);

        wait_result_t receive_packet (packet& pkt, std::chrono::steady_clock::time_point deadline);
        void handle_unknown_tid (const ip_addr& from, size_t size);

        transfer_result_t send_file (data_source& src);
        transfer_result_t receive_file (data_sink& sink,
                                        const std::vector<char>& initial_reply,
                                        const packet* first_block);
        transfer_result_t receive_blocks (data_sink& sink,
                                          const std::vector<char>& initial_reply,
                                          const packet* first_block);
        void linger (const std::vector<char>& final_ack);

        transfer_result_t complete ();
        transfer_result_t fail (error_kind_t kind,
                                uint16_t code,
                                const std::string& msg,
                                bool send_error);
        transfer_result_t fail_wait (wait_result_t wait_result);
        transfer_result_t fail_io (int errnum, bool reading);
        transfer_result_t fail_peer (const packet& pkt);
        transfer_result_t fail_unexpected (const packet& pkt);

        std::chrono::steady_clock::time_point next_deadline () const;

        transport& tr;
        session_config_t cfg;
        transfer_params_t prm;
        transfer_state_t st;
        ip_addr peer_addr;
        bool peer_fixed;
        bool read_request;
        bool is_client;
        std::string file_name;
        std::string sess_id;
        std::string wait_error_msg;
        std::vector<char> rx_buf;
        std::vector<char> tx_buf;
        uint64_t num_bytes;
    };


}


#endif
