#include "client/bank_api.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"

namespace {

FieldMap start_body(const FieldMap& extra) {
    if (extra.is_null()) {
        return FieldMap::object();
    }
    if (!extra.is_object()) {
        throw RequestError("Extra business fields must be a JSON object");
    }
    return extra;
}

void require(const std::string& value, const char* name) {
    if (value.empty()) {
        throw RequestError(std::string(name) + " is required");
    }
}

// Missing, null, empty string, empty container, zero or false all count as absent.
bool field_present(const FieldMap& body, const char* name) {
    auto it = body.find(name);
    if (it == body.end() || it->is_null()) {
        return false;
    }
    if (it->is_string()) {
        return !it->get_ref<const std::string&>().empty();
    }
    if (it->is_object() || it->is_array()) {
        return !it->empty();
    }
    if (it->is_boolean()) {
        return it->get<bool>();
    }
    if (it->is_number()) {
        return it->get<double>() != 0.0;
    }
    return true;
}

void require_field(const FieldMap& body, const char* name) {
    if (!field_present(body, name)) {
        throw RequestError(std::string(name) + " is required");
    }
}

} // namespace

BankApi::BankApi(std::shared_ptr<const BankClient> client) : client_(std::move(client)) {
    if (!client_) {
        throw ConfigError("BankApi needs a client");
    }
}

BankResponse BankApi::call(const char* path, const FieldMap& body) const {
    LOG_DEBUG("Endpoint ", path, " with ", body.size(), " business field(s)");
    return client_->post(path, body);
}

BankResponse BankApi::query_account_balance(const std::string& pay_acct_no, const FieldMap& extra) const {
    require(pay_acct_no, "payAcctNo");
    FieldMap body = start_body(extra);
    body["payAcctNo"] = pay_acct_no;
    return call(Endpoints::ACCOUNT_BALANCE, body);
}

BankResponse BankApi::single_transfer(const FieldMap& fields) const {
    static const char* const required[] = {
        "payAcctNo", "transAmt", "payAcctName", "rcvAcctNo",
        "rcvAcctName", "inbankno", "orderNo", "reserve2"
    };
    FieldMap body = start_body(fields);
    for (const char* name : required) {
        require_field(body, name);
    }
    auto default_if_blank = [&body](const char* name, const char* value) {
        auto it = body.find(name);
        if (it == body.end() || it->is_null() || (it->is_string() && it->get<std::string>().empty())) {
            body[name] = value;
        }
    };
    default_if_blank("curCode", "1");
    default_if_blank("curType", "0");
    return call(Endpoints::SINGLE_TRANSFER, body);
}

BankResponse BankApi::query_single_transfer_result(const FieldMap& fields) const {
    return call(Endpoints::SINGLE_TRANSFER_RESULT, start_body(fields));
}

BankResponse BankApi::batch_transfer(const FieldMap& fields) const {
    return call(Endpoints::BATCH_TRANSFER, start_body(fields));
}

BankResponse BankApi::query_batch_transfer_result(const std::string& pay_acct_no, const std::string& batch_no,
                                                  const FieldMap& extra) const {
    require(pay_acct_no, "payAcctNo");
    require(batch_no, "batchNo");
    FieldMap body = start_body(extra);
    body["payAcctNo"] = pay_acct_no;
    body["batchNo"] = batch_no;
    return call(Endpoints::BATCH_TRANSFER_RESULT, body);
}

BankResponse BankApi::query_hour_details(const std::string& pay_acct_no, const std::string& start_date,
                                         const std::string& end_date, const FieldMap& extra) const {
    require(pay_acct_no, "payAcctNo");
    require(start_date, "startDate");
    require(end_date, "endDate");
    FieldMap body = start_body(extra);
    body["payAcctNo"] = pay_acct_no;
    body["startDate"] = start_date;
    body["endDate"] = end_date;
    return call(Endpoints::HOUR_DETAILS, body);
}

BankResponse BankApi::download_details_receipt(const std::string& acct_no, const std::string& trans_date,
                                               const std::string& trans_seqno,
                                               const std::string& trans_oper_no,
                                               const std::string& trans_brno,
                                               const FieldMap& extra) const {
    require(acct_no, "acctNo");
    require(trans_date, "transDate");
    require(trans_seqno, "transSeqno");
    FieldMap body = start_body(extra);
    body["acctNo"] = acct_no;
    body["transDate"] = trans_date;
    body["transSeqno"] = trans_seqno;
    if (!trans_oper_no.empty()) {
        body["transOperNo"] = trans_oper_no;
    }
    if (!trans_brno.empty()) {
        body["transBrno"] = trans_brno;
    }
    return call(Endpoints::DETAILS_RECEIPT, body);
}

BankResponse BankApi::check_account(const std::string& pay_acct_no, const std::string& start_date,
                                    const std::string& end_date, const FieldMap& extra) const {
    require(pay_acct_no, "payAcctNo");
    require(start_date, "startDate");
    require(end_date, "endDate");
    FieldMap body = start_body(extra);
    body["payAcctNo"] = pay_acct_no;
    body["startDate"] = start_date;
    body["endDate"] = end_date;
    return call(Endpoints::CHECK_ACCOUNT, body);
}

BankResponse BankApi::update_check_result(const FieldMap& fields) const {
    return call(Endpoints::CHECK_RESULT_UPDATE, start_body(fields));
}

BankResponse BankApi::query_subacct_balance(const std::string& pay_acct_no, const FieldMap& extra) const {
    require(pay_acct_no, "payAcctNo");
    FieldMap body = start_body(extra);
    body["payAcctNo"] = pay_acct_no;
    return call(Endpoints::SUBACCT_BALANCE, body);
}

BankResponse BankApi::query_hour_details2(const std::string& pay_acct_no, const std::string& start_date,
                                          const std::string& end_date, const FieldMap& extra) const {
    require(pay_acct_no, "payAcctNo");
    require(start_date, "startDate");
    require(end_date, "endDate");
    FieldMap body = start_body(extra);
    body["payAcctNo"] = pay_acct_no;
    body["startDate"] = start_date;
    body["endDate"] = end_date;
    return call(Endpoints::HOUR_DETAILS2, body);
}

BankResponse BankApi::query_receipt_details(const FieldMap& fields) const {
    return call(Endpoints::RECEIPT_DETAILS, start_body(fields));
}

BankResponse BankApi::query_bank_infos(const std::string& type, const std::string& bank_name,
                                       const std::string& bank_no, const FieldMap& extra) const {
    require(type, "type");
    FieldMap body = start_body(extra);
    body["type"] = type;
    if (type == BANK_INFO_BY_NAME) {
        if (bank_name.empty()) {
            throw RequestError("type=0 requires bankName");
        }
        body["bankName"] = bank_name;
    } else if (type == BANK_INFO_BY_NUMBER) {
        if (bank_no.empty()) {
            throw RequestError("type=1 requires bankNo");
        }
        body["bankNo"] = bank_no;
    }
    return call(Endpoints::BANK_INFOS, body);
}

BankResponse BankApi::query_cert_expiry(const std::string& pay_acct_no, const FieldMap& extra) const {
    require(pay_acct_no, "payAcctNo");
    FieldMap body = start_body(extra);
    body["payAcctNo"] = pay_acct_no;
    return call(Endpoints::CERT_EXPIRY, body);
}
