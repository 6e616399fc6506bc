#pragma once

/**
 * HttpTransferSource.hpp
 *
 * TransferSource backed by utils::HttpClient.
 */

#include "TransferSource.hpp"
#include "../../utils/HttpClient.hpp"

namespace fetchkit::core::transfer {

class HttpTransferSource : public TransferSource {
public:
    HttpTransferSource() = default;

    std::unique_ptr<TransferStream> open(const TransferRequest& request) override;

private:
    utils::HttpClient m_client;
};

} // namespace fetchkit::core::transfer
