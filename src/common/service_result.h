/*******************************************************************************
    Project: SHIELD Delayed Submission Service

    File: service_result.h

    Description:
        Structured outcome of every user-visible operation: flushes,
        inter-instance transfers and endpoint replies. Callers never see a
        raw fault; they get {successful, message, data}.

        The same envelope travels over the inter-instance HTTP channel as
        {"successful": bool, "message": string, "data": T}.

*******************************************************************************/

#ifndef SERVICE_RESULT_H
#define SERVICE_RESULT_H

#include <string>
#include <utility>

namespace dss {

template <typename T>
struct ServiceResult {
    bool successful;
    std::string message;
    T data;

    ServiceResult() : successful(false), data() {}

    static ServiceResult success(T value, std::string msg) {
        ServiceResult result;
        result.successful = true;
        result.message = std::move(msg);
        result.data = std::move(value);
        return result;
    }

    static ServiceResult failure(std::string msg) {
        ServiceResult result;
        result.successful = false;
        result.message = std::move(msg);
        return result;
    }
};

} // namespace dss

#endif // SERVICE_RESULT_H
