// Copyright (c) 2025, Artifetch Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef ARTIFETCH_RESOURCE_TRANSFER_HPP
#define ARTIFETCH_RESOURCE_TRANSFER_HPP

#include <cstdint>
#include <exception>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace artifetch::resource
{
    enum class RequestType
    {
        get,
        put
    };

    auto name_of(RequestType type) -> const char*;

    /*****************************
     * Transfer event structures *
     *****************************/

    /** Description of the resource being transferred. */
    struct ResourceDescriptor
    {
        std::string name = "";
        bool exists = false;
        std::optional<std::int64_t> content_length = std::nullopt;
    };

    struct TransferInitiated
    {
        ResourceDescriptor resource = {};
        RequestType request_type = RequestType::get;
    };

    struct TransferProgressed
    {
        RequestType request_type = RequestType::get;
        std::size_t chunk_size = 0;
        std::int64_t transferred = 0;
        std::optional<std::int64_t> total_length = std::nullopt;
    };

    struct TransferCompleted
    {
        ResourceDescriptor resource = {};
        RequestType request_type = RequestType::get;
        std::int64_t transferred = 0;
    };

    struct TransferFailed
    {
        ResourceDescriptor resource = {};
        RequestType request_type = RequestType::get;
        std::string message = "";
    };

    using TransferEvent = std::variant<TransferInitiated, TransferProgressed, TransferCompleted, TransferFailed>;

    /**********************
     *  TransferListener  *
     **********************/

    class TransferListener
    {
    public:

        virtual ~TransferListener() = default;

        TransferListener(const TransferListener&) = delete;
        TransferListener& operator=(const TransferListener&) = delete;
        TransferListener(TransferListener&&) = delete;
        TransferListener& operator=(TransferListener&&) = delete;

        void on_transfer_event(const TransferEvent& event);

    protected:

        TransferListener() = default;

    private:

        virtual void on_transfer_event_impl(const TransferEvent& event) = 0;
    };

    /** A listener forwarding the events to a callback. */
    class CallbackTransferListener final : public TransferListener
    {
    public:

        using callback_t = std::function<void(const TransferEvent&)>;

        explicit CallbackTransferListener(callback_t callback);

    private:

        void on_transfer_event_impl(const TransferEvent& event) override;

        callback_t m_callback;
    };

    /**********************
     *  TransferNotifier  *
     **********************/

    /**
     * Dispatch transfer events to the registered listeners, in registration order.
     *
     * A listener removed while an event is dispatched does not receive it anymore,
     * a listener added during the dispatch receives the next events.
     */
    class TransferNotifier
    {
    public:

        void add_listener(TransferListener& listener);
        void remove_listener(const TransferListener& listener);
        [[nodiscard]] bool has_listener(const TransferListener& listener) const;

        void fire(const TransferEvent& event) const;

        void fire_transfer_initiated(const ResourceDescriptor& resource, RequestType type) const;
        void fire_transfer_completed(
            const ResourceDescriptor& resource,
            RequestType type,
            std::int64_t transferred
        ) const;
        void fire_transfer_failed(
            const ResourceDescriptor& resource,
            RequestType type,
            const std::exception& error
        ) const;

    private:

        std::vector<TransferListener*> m_listeners;
    };

    /**********************
     *  TransferProgress  *
     **********************/

    /**
     * Byte accounting of the current transfer, reporting each chunk as a
     * `TransferProgressed` event.
     */
    class TransferProgress
    {
    public:

        explicit TransferProgress(const TransferNotifier& notifier);

        /** Start accounting a new transfer. */
        void begin(RequestType type, std::optional<std::int64_t> total_length);

        /** Forget the total length once a transfer is over, the transferred count is kept. */
        void end();

        void add(std::size_t chunk_size);

        [[nodiscard]] std::optional<std::int64_t> total_length() const;
        [[nodiscard]] std::int64_t transferred() const;
        [[nodiscard]] RequestType request_type() const;

    private:

        const TransferNotifier* p_notifier;
        mutable std::mutex m_mutex;
        RequestType m_request_type = RequestType::get;
        std::optional<std::int64_t> m_total_length = std::nullopt;
        std::int64_t m_transferred = 0;
    };
}

#endif
