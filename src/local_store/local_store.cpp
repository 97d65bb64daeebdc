#include "local_store.hpp"

#include <algorithm>

namespace local_store
{
    namespace
    {
        bool lessThan(const json &a, const json &b)
        {
            if (a.is_number() && b.is_number())
                return a.get<double>() < b.get<double>();
            if (a.is_string() && b.is_string())
                return a.get_ref<const std::string &>() < b.get_ref<const std::string &>();
            return a.dump() < b.dump();
        }
    }

    void sortRecords(std::vector<json> &records, const OrderBy &order)
    {
        if (order.field.empty())
            return;
        const auto &field = order.field;
        std::stable_sort(records.begin(), records.end(),
                         [&](const json &lhs, const json &rhs)
                         {
                             bool lhs_has = lhs.contains(field);
                             bool rhs_has = rhs.contains(field);
                             if (!lhs_has || !rhs_has)
                                 return lhs_has && !rhs_has;
                             return order.ascending ? lessThan(lhs.at(field), rhs.at(field))
                                                    : lessThan(rhs.at(field), lhs.at(field));
                         });
    }
} // namespace local_store
