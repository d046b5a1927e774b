#include "DataType.hpp"
#include "Column.hpp"
#include "DriverErrors.hpp"
#include <cassert>
#include <iostream>

void test_parse_scalar_types() {
    assert(DataType::parse("int").tag == TypeTag::INTEGER);
    assert(DataType::parse("BIGINT").tag == TypeTag::INTEGER);
    assert(DataType::parse("int64").tag == TypeTag::INTEGER);
    assert(DataType::parse("uint8").tag == TypeTag::INTEGER);
    assert(DataType::parse("double").tag == TypeTag::FLOAT);
    assert(DataType::parse("float32").tag == TypeTag::FLOAT);
    assert(DataType::parse("double precision").tag == TypeTag::FLOAT);
    assert(DataType::parse("text").tag == TypeTag::STRING);
    assert(DataType::parse("date").tag == TypeTag::DATE);
    assert(DataType::parse("pgdate").tag == TypeTag::DATE);
    assert(DataType::parse("timestamp").tag == TypeTag::DATETIME);
    assert(DataType::parse("datetime").tag == TypeTag::DATETIME);
    assert(DataType::parse("timestamptz").tag == TypeTag::DATETIME_TZ);
    assert(DataType::parse("boolean").tag == TypeTag::BOOLEAN);
    assert(DataType::parse("bytea").tag == TypeTag::BYTES);
    std::cout << "test_parse_scalar_types passed" << std::endl;
}

void test_parse_unknown_is_string() {
    DataType t = DataType::parse("geography");
    assert(t.tag == TypeTag::STRING);
    assert(!t.nullable);
    std::cout << "test_parse_unknown_is_string passed" << std::endl;
}

void test_parse_nullable() {
    DataType a = DataType::parse("int null");
    assert(a.tag == TypeTag::INTEGER);
    assert(a.nullable);

    DataType b = DataType::parse("Nullable(String)");
    assert(b.tag == TypeTag::STRING);
    assert(b.nullable);

    assert(!DataType::parse("int").nullable);
    std::cout << "test_parse_nullable passed" << std::endl;
}

void test_parse_decimal() {
    DataType d = DataType::parse("decimal(38, 3)");
    assert(d.tag == TypeTag::DECIMAL);
    assert(d.precision == 38);
    assert(d.scale == 3);

    DataType n = DataType::parse("numeric(10)");
    assert(n.precision == 10);
    assert(n.scale == 0);

    DataType def = DataType::parse("decimal");
    assert(def.precision == DataType::DEFAULT_DECIMAL_PRECISION);
    assert(def.scale == DataType::DEFAULT_DECIMAL_SCALE);
    std::cout << "test_parse_decimal passed" << std::endl;
}

void test_parse_invalid_decimal() {
    for (const char* raw : {"decimal(a, 2)", "decimal(2, 5)", "decimal(0)", "decimal(, 1)"}) {
        bool caught = false;
        try {
            DataType::parse(raw);
        } catch (const DataError&) {
            caught = true;
        }
        assert(caught);
        (void)caught;
    }
    std::cout << "test_parse_invalid_decimal passed" << std::endl;
}

void test_parse_unbalanced() {
    bool caught = false;
    try {
        DataType::parse("array(int");
    } catch (const DataError& e) {
        caught = std::string(e.what()).find("Unbalanced") != std::string::npos;
    }
    assert(caught);
    (void)caught;
    std::cout << "test_parse_unbalanced passed" << std::endl;
}

void test_parse_nested_arrays() {
    DataType t = DataType::parse("array(array(int null)) null");
    assert(t.tag == TypeTag::ARRAY);
    assert(t.nullable);
    assert(t.array_depth() == 2);
    assert(t.element->tag == TypeTag::ARRAY);
    assert(!t.element->nullable);
    assert(t.element->element->tag == TypeTag::INTEGER);
    assert(t.element->element->nullable);
    std::cout << "test_parse_nested_arrays passed" << std::endl;
}

void test_canonical_names() {
    assert(DataType::parse("INT").name() == "long");
    assert(DataType::parse("decimal(12,2) null").name() == "decimal(12, 2) null");
    assert(DataType::parse("array(text)").name() == "array(text)");
    assert(DataType::parse("array(timestamptz null)").name() == "array(timestamptz null)");
    assert(DataType::parse(DataType::parse("array(decimal(5, 1))").name()) ==
           DataType::parse("array(numeric(5,1))"));
    std::cout << "test_canonical_names passed" << std::endl;
}

void test_equality() {
    assert(DataType::parse("decimal(10, 2)") != DataType::parse("decimal(10, 3)"));
    assert(DataType::parse("array(int)") == DataType::array_of(DataType::of(TypeTag::INTEGER)));
    assert(DataType::parse("array(int)") != DataType::parse("array(text)"));
    assert(DataType::parse("int") != DataType::parse("int null"));
    std::cout << "test_equality passed" << std::endl;
}

void test_column_from_declared() {
    Column c = Column::from_declared("price", "decimal(10, 4) null");
    assert(c.name == "price");
    assert(c.type_code.tag == TypeTag::DECIMAL);
    assert(c.precision && *c.precision == 10);
    assert(c.scale && *c.scale == 4);
    assert(c.null_ok && *c.null_ok);
    assert(!c.display_size);

    Column id = Column::from_declared("id", "int");
    assert(!id.precision);
    assert(!id.null_ok);
    assert(id != c);
    std::cout << "test_column_from_declared passed" << std::endl;
}

int main() {
    test_parse_scalar_types();
    test_parse_unknown_is_string();
    test_parse_nullable();
    test_parse_decimal();
    test_parse_invalid_decimal();
    test_parse_unbalanced();
    test_parse_nested_arrays();
    test_canonical_names();
    test_equality();
    test_column_from_declared();

    std::cout << "All DataType tests passed." << std::endl;
    return 0;
}
