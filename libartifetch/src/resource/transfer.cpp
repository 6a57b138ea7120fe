// Copyright (c) 2025, Artifetch Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <algorithm>

#include "artifetch/resource/transfer.hpp"

namespace artifetch::resource
{
    auto name_of(RequestType type) -> const char*
    {
        return type == RequestType::put ? "PUT" : "GET";
    }

    /**********************
     *  TransferListener  *
     **********************/

    void TransferListener::on_transfer_event(const TransferEvent& event)
    {
        on_transfer_event_impl(event);
    }

    CallbackTransferListener::CallbackTransferListener(callback_t callback)
        : m_callback(std::move(callback))
    {
    }

    void CallbackTransferListener::on_transfer_event_impl(const TransferEvent& event)
    {
        if (m_callback)
        {
            m_callback(event);
        }
    }

    /**********************
     *  TransferNotifier  *
     **********************/

    void TransferNotifier::add_listener(TransferListener& listener)
    {
        if (!has_listener(listener))
        {
            m_listeners.push_back(&listener);
        }
    }

    void TransferNotifier::remove_listener(const TransferListener& listener)
    {
        m_listeners.erase(
            std::remove(m_listeners.begin(), m_listeners.end(), &listener),
            m_listeners.end()
        );
    }

    bool TransferNotifier::has_listener(const TransferListener& listener) const
    {
        return std::find(m_listeners.cbegin(), m_listeners.cend(), &listener) != m_listeners.cend();
    }

    void TransferNotifier::fire(const TransferEvent& event) const
    {
        // Listeners may register or remove listeners while handling the event.
        const auto listeners = m_listeners;
        for (auto* listener : listeners)
        {
            if (has_listener(*listener))
            {
                listener->on_transfer_event(event);
            }
        }
    }

    void
    TransferNotifier::fire_transfer_initiated(const ResourceDescriptor& resource, RequestType type) const
    {
        fire(TransferInitiated{ resource, type });
    }

    void TransferNotifier::fire_transfer_completed(
        const ResourceDescriptor& resource,
        RequestType type,
        std::int64_t transferred
    ) const
    {
        fire(TransferCompleted{ resource, type, transferred });
    }

    void TransferNotifier::fire_transfer_failed(
        const ResourceDescriptor& resource,
        RequestType type,
        const std::exception& error
    ) const
    {
        fire(TransferFailed{ resource, type, error.what() });
    }

    /**********************
     *  TransferProgress  *
     **********************/

    TransferProgress::TransferProgress(const TransferNotifier& notifier)
        : p_notifier(&notifier)
    {
    }

    void TransferProgress::begin(RequestType type, std::optional<std::int64_t> total_length)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_request_type = type;
        m_total_length = total_length;
        m_transferred = 0;
    }

    void TransferProgress::end()
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_total_length = std::nullopt;
    }

    void TransferProgress::add(std::size_t chunk_size)
    {
        TransferProgressed event;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_transferred += static_cast<std::int64_t>(chunk_size);
            event = { m_request_type, chunk_size, m_transferred, m_total_length };
        }
        p_notifier->fire(event);
    }

    std::optional<std::int64_t> TransferProgress::total_length() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_total_length;
    }

    std::int64_t TransferProgress::transferred() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_transferred;
    }

    RequestType TransferProgress::request_type() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_request_type;
    }
}
