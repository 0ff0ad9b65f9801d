#pragma once

#include <cstddef>
#include <iterator>
#include <string>
#include <string_view>

#include "config.hpp"
#include "io.hpp"
#include "json_writer.hpp"
#include "metadata_table.hpp"
#include "writer_concept.hpp"

namespace StrucType {

enum class SerializeError {
    NO_ERROR,
    WRITER_ERROR
};

template <CharOutputIterator OutIter, class WriterError>
class SerializeResult {
    SerializeError m_error = SerializeError::NO_ERROR;
    WriterError m_writerError{};
    OutIter m_pos;
    std::size_t m_bytesWritten = 0;
public:
    constexpr SerializeResult(SerializeError err, WriterError werr, OutIter pos, std::size_t bytes):
        m_error(err), m_writerError(werr), m_pos(pos), m_bytesWritten(bytes)
    {}
    constexpr operator bool() const {
        return m_error == SerializeError::NO_ERROR;
    }
    constexpr OutIter pos() const {
        return m_pos;
    }
    constexpr SerializeError error() const {
        return m_error;
    }
    constexpr WriterError writerError() const {
        return m_writerError;
    }
    constexpr std::size_t bytesWritten() const {
        return m_bytesWritten;
    }
};

namespace serializer_details {

template <CharOutputIterator OutIter, class WriterError>
class SerializationContext {
    SerializeError error = SerializeError::NO_ERROR;
    WriterError writerError{};
    OutIter m_pos;
    std::size_t m_bytes = 0;

public:
    constexpr SerializationContext(OutIter it): m_pos(it) {}

    template<class Writer>
    constexpr bool withWriterError(Writer & writer) {
        error = SerializeError::WRITER_ERROR;
        writerError = writer.getError();
        m_pos = writer.current();
        return false;
    }

    template<class Writer>
    constexpr void finish(Writer & writer) {
        m_pos = writer.current();
        m_bytes = writer.finish();
    }

    constexpr SerializeResult<OutIter, WriterError> result() const {
        return SerializeResult<OutIter, WriterError>(error, writerError, m_pos, m_bytes);
    }
};

template <writer::WriterLike Writer, class CTX>
constexpr bool SerializeString(std::string_view s, Writer & writer, CTX & ctx) {
    if(!writer.write_string(s.data(), s.size())) {
        return ctx.withWriterError(writer);
    }
    return true;
}

// {"key":"value",...} in token order
template <writer::WriterLike Writer, class CTX>
constexpr bool SerializeMetadataMap(const MetadataMap & map, Writer & writer, CTX & ctx) {
    typename Writer::MapFrame fr;
    if(!writer.write_map_begin(map.size(), fr)) {
        return ctx.withWriterError(writer);
    }
    std::size_t count = 0;
    for(const auto & [key, value] : map) {
        if(count > 0) {
            if(!writer.advance_after_value(fr)) {
                return ctx.withWriterError(writer);
            }
        }
        if(!SerializeString(key, writer, ctx)) return false;
        if(!writer.move_to_value(fr)) {
            return ctx.withWriterError(writer);
        }
        if(!SerializeString(value, writer, ctx)) return false;
        count ++;
    }
    if(!writer.write_map_end(fr)) {
        return ctx.withWriterError(writer);
    }
    return true;
}

// Key/value form: [{"field":{...}},...]
template <std::size_t N, writer::WriterLike Writer, class CTX>
constexpr bool SerializeTableRows(const MetadataTable<form::KeyValue, N> & table, Writer & writer, CTX & ctx) {
    typename Writer::ArrayFrame arr;
    if(!writer.write_array_begin(N, arr)) {
        return ctx.withWriterError(writer);
    }
    for(std::size_t i = 0; i < N; i ++) {
        if(i > 0) {
            if(!writer.advance_after_value(arr)) {
                return ctx.withWriterError(writer);
            }
        }
        typename Writer::MapFrame fr;
        if(!writer.write_map_begin(1, fr)) {
            return ctx.withWriterError(writer);
        }
        if(!SerializeString(table[i].fieldName, writer, ctx)) return false;
        if(!writer.move_to_value(fr)) {
            return ctx.withWriterError(writer);
        }
        if(!SerializeMetadataMap(table[i].metadata, writer, ctx)) return false;
        if(!writer.write_map_end(fr)) {
            return ctx.withWriterError(writer);
        }
    }
    if(!writer.write_array_end(arr)) {
        return ctx.withWriterError(writer);
    }
    return true;
}

// Legacy form: {"field":"label",...}
template <std::size_t N, writer::WriterLike Writer, class CTX>
constexpr bool SerializeTableRows(const MetadataTable<form::Label, N> & table, Writer & writer, CTX & ctx) {
    typename Writer::MapFrame fr;
    if(!writer.write_map_begin(N, fr)) {
        return ctx.withWriterError(writer);
    }
    for(std::size_t i = 0; i < N; i ++) {
        if(i > 0) {
            if(!writer.advance_after_value(fr)) {
                return ctx.withWriterError(writer);
            }
        }
        if(!SerializeString(table[i].fieldName, writer, ctx)) return false;
        if(!writer.move_to_value(fr)) {
            return ctx.withWriterError(writer);
        }
        if(!SerializeString(table[i].metadata, writer, ctx)) return false;
    }
    if(!writer.write_map_end(fr)) {
        return ctx.withWriterError(writer);
    }
    return true;
}

} // namespace serializer_details

template <class Form, std::size_t N, writer::WriterLike Writer>
constexpr auto SerializeTableWithWriter(const MetadataTable<Form, N> & table, Writer & writer) {
    serializer_details::SerializationContext<typename Writer::iterator_type, typename Writer::error_type> ctx(writer.current());
    if(serializer_details::SerializeTableRows(table, writer, ctx)) {
        ctx.finish(writer);
    }
    return ctx.result();
}

template <bool Pretty = false, class Form, std::size_t N, CharOutputIterator It, CharSentinelForOut<It> Sent>
constexpr auto SerializeTable(const MetadataTable<Form, N> & table, It & begin, const Sent & end) {
    JsonIteratorWriter<It, Sent, Pretty> writer(begin, end);
    auto res = SerializeTableWithWriter(table, writer);
    begin = res.pos();
    return res;
}

template <bool Pretty = false, class Form, std::size_t N>
constexpr auto SerializeTable(const MetadataTable<Form, N> & table, std::string & out) {
    using io_details::limitless_sentinel;

    out.clear();

    auto it = std::back_inserter(out);
    limitless_sentinel end{};

    return SerializeTable<Pretty>(table, it, end);
}

} // namespace StrucType
