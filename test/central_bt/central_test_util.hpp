#ifndef CBT_TEST_CENTRAL_TEST_UTIL_HPP_
#define CBT_TEST_CENTRAL_TEST_UTIL_HPP_

#include <cstdint>
#include <string>
#include <vector>
#include <mutex>
#include <algorithm>
#include <unordered_map>

#include <jau/darray.hpp>
#include <jau/fraction_type.hpp>

#include <central_bt/CentralManager.hpp>

namespace central_bt_test {

    using namespace central_bt;

    /**
     * Scripted RadioManager recording all commands.
     * <p>
     * Notifications are delivered synchronously to the attached listener via the emit*() methods.
     * </p>
     */
    class FakeRadioManager : public RadioManager {
        public:
            enum class Command : uint8_t {
                START_SCAN,
                STOP_SCAN,
                CONNECT,
                CANCEL_CONNECTION
            };
            struct Record {
                Command cmd;
                PeripheralId target;
            };

        private:
            mutable std::mutex mtx;
            std::vector<Record> commands;
            std::unordered_map<PeripheralId, PeripheralState> known;
            RadioEventListenerRef listener;
            ScanFilter lastFilter;

            void record(const Command cmd, const PeripheralId& target) {
                const std::lock_guard<std::mutex> lock(mtx); // RAII-style acquire and relinquish via destructor
                commands.push_back(Record{cmd, target});
            }

            RadioEventListenerRef getListener() const {
                const std::lock_guard<std::mutex> lock(mtx); // RAII-style acquire and relinquish via destructor
                return listener;
            }

        public:
            void setEventListener(const RadioEventListenerRef& l) override {
                const std::lock_guard<std::mutex> lock(mtx); // RAII-style acquire and relinquish via destructor
                listener = l;
            }

            void startScan(const ScanFilter& filter) override {
                {
                    const std::lock_guard<std::mutex> lock(mtx); // RAII-style acquire and relinquish via destructor
                    lastFilter = filter;
                }
                record(Command::START_SCAN, PeripheralId());
            }

            void stopScan() override { record(Command::STOP_SCAN, PeripheralId()); }

            void connect(const PeripheralId& target) override { record(Command::CONNECT, target); }

            void cancelConnection(const PeripheralId& target) override { record(Command::CANCEL_CONNECTION, target); }

            jau::darray<KnownPeripheral> retrieveKnownPeripherals(const jau::darray<PeripheralId>& ids) override {
                const std::lock_guard<std::mutex> lock(mtx); // RAII-style acquire and relinquish via destructor
                jau::darray<KnownPeripheral> res;
                for(size_t i=0; i<ids.size(); ++i) {
                    auto it = known.find(ids[i]);
                    if( known.end() != it ) {
                        res.push_back(KnownPeripheral{it->first, it->second});
                    }
                }
                return res;
            }

            std::string toString() const noexcept override { return "FakeRadioManager[]"; }

            void setKnownState(const PeripheralId& target, const PeripheralState state) {
                const std::lock_guard<std::mutex> lock(mtx); // RAII-style acquire and relinquish via destructor
                known[target] = state;
            }

            bool hasListener() const { return nullptr != getListener(); }

            ScanFilter getLastFilter() const {
                const std::lock_guard<std::mutex> lock(mtx); // RAII-style acquire and relinquish via destructor
                return lastFilter;
            }

            size_t commandCount() const {
                const std::lock_guard<std::mutex> lock(mtx); // RAII-style acquire and relinquish via destructor
                return commands.size();
            }

            size_t count(const Command cmd) const {
                const std::lock_guard<std::mutex> lock(mtx); // RAII-style acquire and relinquish via destructor
                return static_cast<size_t>( std::count_if(commands.begin(), commands.end(), [cmd](const Record& r) { return cmd == r.cmd; }) );
            }

            size_t count(const Command cmd, const PeripheralId& target) const {
                const std::lock_guard<std::mutex> lock(mtx); // RAII-style acquire and relinquish via destructor
                return static_cast<size_t>( std::count_if(commands.begin(), commands.end(),
                                     [cmd, &target](const Record& r) { return cmd == r.cmd && target == r.target; }) );
            }

            std::vector<Record> getCommands() const {
                const std::lock_guard<std::mutex> lock(mtx); // RAII-style acquire and relinquish via destructor
                return commands;
            }

            void clearCommands() {
                const std::lock_guard<std::mutex> lock(mtx); // RAII-style acquire and relinquish via destructor
                commands.clear();
            }

            void emitState(const ReadinessState s) {
                RadioEventListenerRef l = getListener();
                if( nullptr != l ) { l->stateChanged(s); }
            }
            void emitConnected(const PeripheralId& target) {
                RadioEventListenerRef l = getListener();
                if( nullptr != l ) { l->connected(target); }
            }
            void emitFailedToConnect(const PeripheralId& target, const std::error_code& ec) {
                RadioEventListenerRef l = getListener();
                if( nullptr != l ) { l->failedToConnect(target, ec); }
            }
            void emitDisconnected(const PeripheralId& target, const std::error_code& ec) {
                RadioEventListenerRef l = getListener();
                if( nullptr != l ) { l->disconnected(target, ec); }
            }
            void emitDiscovered(const PeripheralId& target, const AdvertisementReport& ad, const int8_t rssi) {
                RadioEventListenerRef l = getListener();
                if( nullptr != l ) { l->discovered(target, ad, rssi); }
            }
            void emitRestoreState(const RestoreState& payload) {
                RadioEventListenerRef l = getListener();
                if( nullptr != l ) { l->willRestoreState(payload); }
            }
    };

    /**
     * DeadlineScheduler driven by a virtual clock, firing deadlines on the calling thread via advance() or fireAll().
     */
    class ManualDeadlineScheduler : public DeadlineScheduler {
        private:
            struct Entry {
                timer_id_t id;
                int64_t expiry_ms;
                Action action;
            };
            std::vector<Entry> entries;
            int64_t now_ms = 0;
            timer_id_t next_id = INVALID_ID;
            bool stopped = false;
            bool joined = false;
            size_t scheduled = 0;
            size_t cancelled = 0;

            bool fireNext(const int64_t until_ms) {
                if( 0 == entries.size() || entries.front().expiry_ms > until_ms ) {
                    return false;
                }
                Action action = std::move(entries.front().action);
                now_ms = std::max(now_ms, entries.front().expiry_ms);
                entries.erase(entries.begin());
                action();
                return true;
            }

        public:
            timer_id_t schedule(const jau::fraction_i64& timeout, Action action) override {
                if( stopped ) {
                    return INVALID_ID;
                }
                const int64_t expiry = now_ms + timeout.to_ms();
                auto it = std::upper_bound(entries.begin(), entries.end(), expiry,
                                           [](const int64_t t, const Entry& e) { return t < e.expiry_ms; });
                entries.insert(it, Entry{++next_id, expiry, std::move(action)});
                ++scheduled;
                return next_id;
            }

            bool cancel(const timer_id_t id) override {
                auto it = std::find_if(entries.begin(), entries.end(), [id](const Entry& e) { return id == e.id; });
                if( entries.end() == it ) {
                    return false;
                }
                entries.erase(it);
                ++cancelled;
                return true;
            }

            void stop() override {
                stopped = true;
                entries.clear();
            }

            void join() override {
                joined = true;
            }

            std::string toString() const noexcept override {
                return "ManualDeadlineScheduler[now "+std::to_string(now_ms)+" ms, pending "+std::to_string(entries.size())+"]";
            }

            /** Advances the virtual clock, firing all deadlines expired meanwhile in expiry order. */
            void advance(const jau::fraction_i64& d) {
                const int64_t until = now_ms + d.to_ms();
                while( fireNext(until) ) { }
                now_ms = until;
            }

            /** Fires all pending deadlines in expiry order. */
            void fireAll() {
                while( fireNext(INT64_MAX) ) { }
            }

            size_t pendingCount() const { return entries.size(); }
            size_t scheduledCount() const { return scheduled; }
            size_t cancelledCount() const { return cancelled; }
            bool isStopped() const { return stopped; }
            bool isJoined() const { return joined; }
    };

    inline PeripheralId peripheral(const std::string& addr) {
        return PeripheralId(addr, PeripheralAddressType::LE_PUBLIC);
    }

    /** Records every CentralError delivered to the returned callback. */
    inline CompletionCallback recorder(std::vector<CentralError>& sink) {
        return [&sink](const CentralError& e) { sink.push_back(e); };
    }

    /** Records every ScanEvent delivered to the returned callback. */
    inline ScanCallback recorder(std::vector<ScanEvent>& sink) {
        return [&sink](const ScanEvent& e) { sink.push_back(e); };
    }

} // namespace central_bt_test

#endif /* CBT_TEST_CENTRAL_TEST_UTIL_HPP_ */
