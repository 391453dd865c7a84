#include "querylab/dataset.h"

namespace querylab {

namespace {

Value I(int64_t v) { return Value::integer(v); }
Value F(double v) { return Value::real(v); }
Value T(const char* v) { return Value::text(v); }
Value B(bool v) { return Value::boolean(v); }
Value D(int y, int m, int d) { return Value::date(y, m, d); }
Value DT(int y, int m, int d, int hh, int mm) { return Value::datetime(y, m, d, hh, mm); }
const Value N = Value::null();

void add_departments(Dataset& ds) {
    ds.add_table("departments", {"id", "name", "budget", "location"}, {
        {{"id", I(1)}, {"name", T("Engineering")}, {"budget", I(500000)}, {"location", T("Building A, Floor 3")}},
        {{"id", I(2)}, {"name", T("Sales")}, {"budget", I(300000)}, {"location", T("Building B, Floor 1")}},
        {{"id", I(3)}, {"name", T("Marketing")}, {"budget", I(200000)}, {"location", T("Building B, Floor 2")}},
        {{"id", I(4)}, {"name", T("HR")}, {"budget", I(150000)}, {"location", N}},
        {{"id", I(5)}, {"name", T("Finance")}, {"budget", I(250000)}, {"location", T("Building A, Floor 1")}},
        {{"id", I(6)}, {"name", T("Research")}, {"budget", I(400000)}, {"location", N}},
    }, "Company departments");
    ds.add_index("departments", "PRIMARY", "id", true);
}

Row employee(int64_t id, const char* name, int64_t dept, Value manager, int64_t salary,
             Value hired, Value email, Value phone) {
    return {{"id", I(id)}, {"name", T(name)}, {"department_id", I(dept)}, {"manager_id", manager},
            {"salary", I(salary)}, {"hire_date", hired}, {"email", email}, {"phone", phone}};
}

void add_employees(Dataset& ds) {
    ds.add_table("employees", {"id", "name", "department_id", "manager_id", "salary", "hire_date", "email", "phone"}, {
        employee(1, "Alice Chen", 1, I(5), 95000, D(2020, 3, 15), T("alice@company.com"), T("555-0101")),
        employee(2, "Bob Smith", 1, I(5), 85000, D(2021, 6, 1), T("bob@company.com"), T("555-0102")),
        employee(3, "Carol Davis", 1, I(5), 110000, D(2019, 1, 10), T("carol@company.com"), N),
        employee(4, "David Lee", 1, I(3), 75000, D(2022, 8, 20), T("david@company.com"), T("555-0104")),
        employee(5, "Eva Martinez", 1, N, 125000, D(2018, 5, 5), T("eva@company.com"), T("555-0105")),
        employee(6, "Frank Wilson", 2, I(9), 65000, D(2021, 2, 14), T("frank@company.com"), T("555-0106")),
        employee(7, "Grace Kim", 2, I(9), 72000, D(2020, 11, 30), T("grace@company.com"), T("555-0107")),
        employee(8, "Henry Brown", 2, I(9), 58000, D(2022, 4, 18), N, T("555-0108")),
        employee(9, "Ivy Taylor", 2, N, 80000, D(2019, 9, 22), T("ivy@company.com"), T("555-0109")),
        employee(10, "Jack Anderson", 2, I(9), 68000, D(2021, 7, 7), T("jack@company.com"), N),
        employee(11, "Karen White", 3, I(13), 62000, D(2020, 6, 12), T("karen@company.com"), T("555-0111")),
        employee(12, "Leo Garcia", 3, I(13), 55000, D(2022, 1, 25), T("leo@company.com"), T("555-0112")),
        employee(13, "Maria Rodriguez", 3, N, 70000, D(2019, 4, 3), T("maria@company.com"), T("555-0113")),
        employee(14, "Nathan Clark", 3, I(13), 48000, D(2023, 2, 8), N, N),
        employee(15, "Olivia Moore", 4, N, 52000, D(2021, 10, 5), T("olivia@company.com"), T("555-0115")),
        employee(16, "Peter Hall", 4, I(15), 58000, D(2020, 8, 17), T("peter@company.com"), T("555-0116")),
        employee(17, "Quinn Adams", 4, I(15), 45000, D(2022, 12, 1), T("quinn@company.com"), T("555-0117")),
        employee(18, "Rachel Scott", 5, I(20), 78000, D(2019, 7, 14), T("rachel@company.com"), T("555-0118")),
        employee(19, "Sam Turner", 5, I(20), 85000, D(2020, 3, 28), T("sam@company.com"), T("555-0119")),
        employee(20, "Tina Phillips", 5, N, 92000, D(2018, 11, 9), T("tina@company.com"), T("555-0120")),
    }, "Company employees with department and manager references");
    ds.add_index("employees", "PRIMARY", "id", true);
    ds.add_index("employees", "idx_salary", "salary");
    ds.add_index("employees", "idx_department", "department_id");
    ds.add_index("employees", "idx_manager", "manager_id");
}

Row customer(int64_t id, const char* name, const char* email, Value city, const char* country,
             Value credit, Value created) {
    return {{"id", I(id)}, {"name", T(name)}, {"email", T(email)}, {"city", city},
            {"country", T(country)}, {"credit_limit", credit}, {"created_at", created}};
}

void add_customers(Dataset& ds) {
    ds.add_table("customers", {"id", "name", "email", "city", "country", "credit_limit", "created_at"}, {
        customer(1, "Acme Corp", "orders@acme.com", T("New York"), "USA", I(50000), DT(2022, 1, 15, 10, 30)),
        customer(2, "TechStart Inc", "purchasing@techstart.io", T("San Francisco"), "USA", I(25000), DT(2022, 3, 22, 14, 45)),
        customer(3, "Global Trade Ltd", "procurement@globaltrade.co.uk", T("London"), "UK", I(75000), DT(2021, 11, 8, 9, 0)),
        customer(4, "DataDriven GmbH", "einkauf@datadriven.de", N, "Germany", I(30000), DT(2022, 6, 1, 11, 15)),
        customer(5, "CloudNine Solutions", "admin@cloudnine.com", T("Toronto"), "Canada", N, DT(2023, 2, 14, 16, 30)),
        customer(6, "StartUp Ventures", "hello@startupventures.com", T("Austin"), "USA", I(10000), DT(2023, 5, 20, 8, 45)),
        customer(7, "Enterprise Systems", "orders@enterprise-sys.com", N, "USA", I(100000), DT(2020, 8, 12, 13, 0)),
        customer(8, "SmallBiz Co", "contact@smallbiz.com", T("Chicago"), "USA", N, DT(2023, 7, 1, 10, 0)),
        customer(9, "Innovation Labs", "procurement@innovlabs.com", T("Seattle"), "USA", I(45000), DT(2022, 9, 5, 15, 30)),
        customer(10, "Mega Industries", "purchasing@megaind.com", T("Detroit"), "USA", I(200000), DT(2019, 4, 18, 9, 30)),
    }, "Customer accounts");
    ds.add_index("customers", "PRIMARY", "id", true);
    ds.add_index("customers", "idx_country", "country");
}

Row product(int64_t id, const char* name, const char* category, double price, int64_t stock,
            Value weight, bool active) {
    return {{"id", I(id)}, {"name", T(name)}, {"category", T(category)}, {"price", F(price)},
            {"stock_quantity", I(stock)}, {"weight", weight}, {"is_active", B(active)}};
}

void add_products(Dataset& ds) {
    ds.add_table("products", {"id", "name", "category", "price", "stock_quantity", "weight", "is_active"}, {
        product(1, "Basic License", "Software", 299.99, 1000, N, true),
        product(2, "Professional License", "Software", 599.99, 500, N, true),
        product(3, "Enterprise License", "Software", 1499.99, 200, N, true),
        product(4, "Premium Add-on", "Software", 199.99, 800, N, true),
        product(5, "Support Package (1yr)", "Service", 499.99, 999, N, true),
        product(6, "USB Security Key", "Hardware", 49.99, 500, F(0.05), true),
        product(7, "Hardware Token", "Hardware", 79.99, 300, F(0.08), true),
        product(8, "Server Appliance", "Hardware", 2999.99, 50, F(15.5), true),
        product(9, "Training Bundle", "Training", 999.99, 100, N, true),
        product(10, "Certification Exam", "Training", 299.99, 999, N, true),
        product(11, "Legacy Module", "Software", 199.99, 0, N, false),
        product(12, "Old Hardware Key", "Hardware", 29.99, 25, F(0.03), false),
    }, "Products and services catalog");
    ds.add_index("products", "PRIMARY", "id", true);
    ds.add_index("products", "idx_category", "category");
}

Row order(int64_t id, int64_t customer_id, int64_t employee_id, Value ordered, Value shipped,
          const char* status, Value notes) {
    return {{"id", I(id)}, {"customer_id", I(customer_id)}, {"employee_id", I(employee_id)},
            {"order_date", ordered}, {"shipped_date", shipped}, {"status", T(status)}, {"notes", notes}};
}

void add_orders(Dataset& ds) {
    ds.add_table("orders", {"id", "customer_id", "employee_id", "order_date", "shipped_date", "status", "notes"}, {
        order(1, 1, 6, D(2023, 1, 15), D(2023, 1, 18), "delivered", N),
        order(2, 2, 7, D(2023, 2, 20), D(2023, 2, 25), "delivered", T("Rush order")),
        order(3, 1, 9, D(2023, 3, 10), D(2023, 3, 15), "delivered", N),
        order(4, 3, 6, D(2023, 3, 25), D(2023, 4, 1), "delivered", T("International shipping")),
        order(5, 4, 10, D(2023, 4, 5), D(2023, 4, 8), "delivered", N),
        order(6, 5, 8, D(2023, 4, 18), D(2023, 4, 22), "delivered", N),
        order(7, 2, 7, D(2023, 5, 8), D(2023, 5, 12), "shipped", N),
        order(8, 6, 9, D(2023, 5, 22), N, "processing", T("Pending payment verification")),
        order(9, 7, 6, D(2023, 6, 3), D(2023, 6, 5), "delivered", N),
        order(10, 1, 10, D(2023, 6, 15), D(2023, 6, 18), "delivered", T("Repeat customer discount applied")),
        order(11, 8, 7, D(2023, 7, 1), N, "pending", N),
        order(12, 9, 8, D(2023, 7, 20), D(2023, 7, 25), "shipped", N),
        order(13, 10, 9, D(2023, 8, 5), D(2023, 8, 8), "delivered", T("VIP customer")),
        order(14, 3, 6, D(2023, 8, 18), N, "cancelled", T("Customer requested cancellation")),
        order(15, 4, 10, D(2023, 9, 2), N, "processing", N),
    }, "Customer orders");
    ds.add_index("orders", "PRIMARY", "id", true);
    ds.add_index("orders", "idx_customer", "customer_id");
    ds.add_index("orders", "idx_employee", "employee_id");
    ds.add_index("orders", "idx_status", "status");
}

Row item(int64_t id, int64_t order_id, int64_t product_id, int64_t quantity, double unit_price, Value discount) {
    return {{"id", I(id)}, {"order_id", I(order_id)}, {"product_id", I(product_id)},
            {"quantity", I(quantity)}, {"unit_price", F(unit_price)}, {"discount", discount}};
}

void add_order_items(Dataset& ds) {
    ds.add_table("order_items", {"id", "order_id", "product_id", "quantity", "unit_price", "discount"}, {
        item(1, 1, 3, 5, 1499.99, F(0.10)),
        item(2, 1, 5, 5, 499.99, N),
        item(3, 2, 2, 10, 599.99, F(0.05)),
        item(4, 2, 9, 2, 999.99, N),
        item(5, 3, 4, 5, 199.99, N),
        item(6, 4, 3, 20, 1499.99, F(0.15)),
        item(7, 4, 8, 2, 2999.99, F(0.10)),
        item(8, 4, 6, 100, 49.99, F(0.20)),
        item(9, 5, 1, 25, 299.99, F(0.05)),
        item(10, 5, 5, 10, 499.99, F(0.05)),
        item(11, 6, 2, 5, 599.99, N),
        item(12, 7, 4, 10, 199.99, F(0.10)),
        item(13, 7, 7, 20, 79.99, N),
        item(14, 8, 1, 5, 299.99, N),
        item(15, 9, 3, 50, 1499.99, F(0.20)),
        item(16, 9, 5, 50, 499.99, F(0.15)),
        item(17, 9, 8, 5, 2999.99, F(0.10)),
        item(18, 10, 10, 10, 299.99, F(0.10)),
        item(19, 11, 1, 3, 299.99, N),
        item(20, 12, 2, 15, 599.99, F(0.10)),
        item(21, 12, 6, 50, 49.99, F(0.05)),
        item(22, 13, 3, 100, 1499.99, F(0.25)),
        item(23, 13, 8, 10, 2999.99, F(0.15)),
        item(24, 13, 5, 100, 499.99, F(0.20)),
        item(25, 14, 3, 5, 1499.99, N),
        item(26, 15, 4, 20, 199.99, F(0.10)),
    }, "Line items for each order (many-to-many)");
    ds.add_index("order_items", "PRIMARY", "id", true);
    ds.add_index("order_items", "idx_order", "order_id");
    ds.add_index("order_items", "idx_product", "product_id");
}

} // namespace

Dataset make_sample_dataset() {
    Dataset ds;
    add_employees(ds);
    add_departments(ds);
    add_customers(ds);
    add_products(ds);
    add_orders(ds);
    add_order_items(ds);
    return ds;
}

} // namespace querylab
