#ifndef WZB_BANK_API_HPP
#define WZB_BANK_API_HPP

#include <memory>
#include <string>

#include "bank_client.hpp"

// Gateway endpoint paths, relative to the configured base URL.
namespace Endpoints {
    constexpr const char* ACCOUNT_BALANCE = "V1/P01502/S01/queryeaccountbalance";
    constexpr const char* SINGLE_TRANSFER = "V1/P01506/S01/singletrans";
    constexpr const char* SINGLE_TRANSFER_RESULT = "V1/P01507/S01/selsingletrans";
    constexpr const char* BATCH_TRANSFER = "V1/P01508/S01/batchtrans";
    constexpr const char* BATCH_TRANSFER_RESULT = "V1/P01509/S01/selbatchtrans";
    constexpr const char* HOUR_DETAILS = "V1/P01512/S01/queryhourdetails";
    constexpr const char* DETAILS_RECEIPT = "V1/P01513/S01/detailsreceipt";
    constexpr const char* CHECK_ACCOUNT = "V1/P01518/S01/checkAcct";
    constexpr const char* CHECK_RESULT_UPDATE = "V1/P01519/S01/checkResultUpdate";
    constexpr const char* SUBACCT_BALANCE = "V1/P01520/S01/queryeSubacctBalance";
    constexpr const char* HOUR_DETAILS2 = "V1/P01522/S01/queryhourdetails2";
    constexpr const char* RECEIPT_DETAILS = "V1/P01523/S01/queryreceiptdetails";
    constexpr const char* BANK_INFOS = "V1/P01524/S01/querybankinfos";
    constexpr const char* CERT_EXPIRY = "V1/P01525/S01/queryCertExpiry";
}

// Bank-info lookup modes for query_bank_infos.
constexpr const char* BANK_INFO_BY_NAME = "0";
constexpr const char* BANK_INFO_BY_NUMBER = "1";

/**
 * @brief Typed wrappers over BankClient::post for the documented endpoints.
 *
 * Each wrapper takes its required fields as arguments and any further
 * business fields in `extra`. The body is `extra` followed by the named
 * fields (a named field overwrites an `extra` entry of the same name in
 * place). Required fields are checked before anything is encrypted or
 * sent; a missing or empty one raises RequestError.
 */
class BankApi {
public:
    explicit BankApi(std::shared_ptr<const BankClient> client);

    BankResponse query_account_balance(const std::string& pay_acct_no,
                                       const FieldMap& extra = FieldMap::object()) const;

    // Requires payAcctNo, transAmt, payAcctName, rcvAcctNo, rcvAcctName,
    // inbankno, orderNo, reserve2. curCode defaults to "1", curType to "0".
    BankResponse single_transfer(const FieldMap& fields) const;

    BankResponse query_single_transfer_result(const FieldMap& fields = FieldMap::object()) const;
    BankResponse batch_transfer(const FieldMap& fields = FieldMap::object()) const;

    BankResponse query_batch_transfer_result(const std::string& pay_acct_no, const std::string& batch_no,
                                             const FieldMap& extra = FieldMap::object()) const;

    BankResponse query_hour_details(const std::string& pay_acct_no, const std::string& start_date,
                                    const std::string& end_date,
                                    const FieldMap& extra = FieldMap::object()) const;

    // trans_oper_no and trans_brno are sent only when non-empty.
    BankResponse download_details_receipt(const std::string& acct_no, const std::string& trans_date,
                                          const std::string& trans_seqno,
                                          const std::string& trans_oper_no = "",
                                          const std::string& trans_brno = "",
                                          const FieldMap& extra = FieldMap::object()) const;

    BankResponse check_account(const std::string& pay_acct_no, const std::string& start_date,
                               const std::string& end_date, const FieldMap& extra = FieldMap::object()) const;

    BankResponse update_check_result(const FieldMap& fields = FieldMap::object()) const;

    BankResponse query_subacct_balance(const std::string& pay_acct_no,
                                       const FieldMap& extra = FieldMap::object()) const;

    BankResponse query_hour_details2(const std::string& pay_acct_no, const std::string& start_date,
                                     const std::string& end_date,
                                     const FieldMap& extra = FieldMap::object()) const;

    BankResponse query_receipt_details(const FieldMap& fields = FieldMap::object()) const;

    // type "0" looks up by bank_name, type "1" by bank_no; the one in use is required.
    BankResponse query_bank_infos(const std::string& type, const std::string& bank_name = "",
                                  const std::string& bank_no = "",
                                  const FieldMap& extra = FieldMap::object()) const;

    BankResponse query_cert_expiry(const std::string& pay_acct_no,
                                   const FieldMap& extra = FieldMap::object()) const;

private:
    BankResponse call(const char* path, const FieldMap& body) const;

    std::shared_ptr<const BankClient> client_;
};

#endif // WZB_BANK_API_HPP
